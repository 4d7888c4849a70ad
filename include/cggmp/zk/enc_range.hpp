#pragma once

#include <span>

#include <gmpxx.h>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/paillier.hpp"
#include "cggmp/crypto/ring_pedersen.hpp"
#include "cggmp/crypto/security_level.hpp"
#include "cggmp/zk/proof_context.hpp"

namespace cggmp {

// K = enc_N0(k; rho) with k in +-2^EllBits.
struct EncRangeStatement {
  PaillierPublicKey prover_key;
  mpz_class ciphertext;
};

struct EncRangeWitness {
  mpz_class plaintext;
  mpz_class randomness;
};

struct EncRangeProof {
  mpz_class s;
  mpz_class a;
  mpz_class c;
  mpz_class z1;
  mpz_class z2;
  mpz_class z3;
};

EncRangeProof ProveEncRange(const ProofContext& ctx,
                            const SecurityLevel& level,
                            const EncRangeStatement& statement,
                            const EncRangeWitness& witness,
                            const RingPedersenParams& verifier_params);

ProofCheck VerifyEncRange(const ProofContext& ctx,
                          const SecurityLevel& level,
                          const EncRangeStatement& statement,
                          const RingPedersenParams& verifier_params,
                          const EncRangeProof& proof);

void AppendEncRangeProof(const EncRangeProof& proof, Bytes* out);
EncRangeProof ReadEncRangeProof(std::span<const uint8_t> input, size_t* offset);

}  // namespace cggmp
