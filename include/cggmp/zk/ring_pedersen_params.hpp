#pragma once

#include <span>
#include <vector>

#include <gmpxx.h>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/ring_pedersen.hpp"
#include "cggmp/zk/proof_context.hpp"

namespace cggmp {

// t lies in the subgroup generated by s: knowledge of lambda with t = s^lambda.
struct RingPedersenParamProof {
  std::vector<mpz_class> commitments;
  std::vector<mpz_class> responses;
};

RingPedersenParamProof ProveRingPedersenParams(const ProofContext& ctx,
                                               const RingPedersenParams& params,
                                               const RingPedersenWitness& witness,
                                               uint32_t repetitions);

ProofCheck VerifyRingPedersenParams(const ProofContext& ctx,
                                    const RingPedersenParams& params,
                                    const RingPedersenParamProof& proof,
                                    uint32_t repetitions);

void AppendRingPedersenParamProof(const RingPedersenParamProof& proof, Bytes* out);
RingPedersenParamProof ReadRingPedersenParamProof(std::span<const uint8_t> input, size_t* offset);

}  // namespace cggmp
