#pragma once

#include <span>

#include <gmpxx.h>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/ring_pedersen.hpp"
#include "cggmp/crypto/security_level.hpp"
#include "cggmp/zk/proof_context.hpp"

namespace cggmp {

// N0 = pq with both factors above 2^-ell * sqrt(N0), proven against the
// verifier's ring-Pedersen parameters.
struct NoSmallFactorProof {
  mpz_class p_commit;
  mpz_class q_commit;
  mpz_class a;
  mpz_class b;
  mpz_class t;
  mpz_class sigma;
  mpz_class z1;
  mpz_class z2;
  mpz_class w1;
  mpz_class w2;
  mpz_class v;
};

NoSmallFactorProof ProveNoSmallFactor(const ProofContext& ctx,
                                      const SecurityLevel& level,
                                      const mpz_class& n0,
                                      const mpz_class& p,
                                      const mpz_class& q,
                                      const RingPedersenParams& verifier_params);

ProofCheck VerifyNoSmallFactor(const ProofContext& ctx,
                               const SecurityLevel& level,
                               const mpz_class& n0,
                               const RingPedersenParams& verifier_params,
                               const NoSmallFactorProof& proof);

void AppendNoSmallFactorProof(const NoSmallFactorProof& proof, Bytes* out);
NoSmallFactorProof ReadNoSmallFactorProof(std::span<const uint8_t> input, size_t* offset);

}  // namespace cggmp
