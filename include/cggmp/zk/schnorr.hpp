#pragma once

#include <span>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/ec_point.hpp"
#include "cggmp/crypto/scalar.hpp"
#include "cggmp/zk/proof_context.hpp"

namespace cggmp {

// Proof of knowledge of x with X = x*G. The commitment A can be published
// ahead of the response (keygen commits to it in its first round).
struct SchnorrCommitment {
  Scalar alpha;
  ECPoint a;
};

struct SchnorrProof {
  ECPoint a;
  Scalar z;
};

SchnorrCommitment SchnorrCommit();
Scalar SchnorrRespond(const ProofContext& ctx,
                      const ECPoint& statement,
                      const SchnorrCommitment& commitment,
                      const Scalar& witness);
ProofCheck VerifySchnorrResponse(const ProofContext& ctx,
                                 const ECPoint& statement,
                                 const ECPoint& commitment,
                                 const Scalar& response);

SchnorrProof ProveSchnorr(const ProofContext& ctx, const ECPoint& statement, const Scalar& witness);
ProofCheck VerifySchnorr(const ProofContext& ctx, const ECPoint& statement, const SchnorrProof& proof);

void AppendSchnorrProof(const SchnorrProof& proof, Bytes* out);
SchnorrProof ReadSchnorrProof(std::span<const uint8_t> input, size_t* offset);

}  // namespace cggmp
