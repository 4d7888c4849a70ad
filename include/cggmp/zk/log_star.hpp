#pragma once

#include <span>

#include <gmpxx.h>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/ec_point.hpp"
#include "cggmp/crypto/paillier.hpp"
#include "cggmp/crypto/ring_pedersen.hpp"
#include "cggmp/crypto/security_level.hpp"
#include "cggmp/zk/proof_context.hpp"

namespace cggmp {

// C = enc_N0(x; rho) and X = x*base with x in +-2^EllBits.
struct LogStarStatement {
  PaillierPublicKey prover_key;
  mpz_class ciphertext;
  ECPoint x;
  ECPoint base;
};

struct LogStarWitness {
  mpz_class x;
  mpz_class rho;
};

struct LogStarProof {
  mpz_class s;
  mpz_class a;
  ECPoint y;
  mpz_class d;
  mpz_class z1;
  mpz_class z2;
  mpz_class z3;
};

LogStarProof ProveLogStar(const ProofContext& ctx,
                          const SecurityLevel& level,
                          const LogStarStatement& statement,
                          const LogStarWitness& witness,
                          const RingPedersenParams& verifier_params);

ProofCheck VerifyLogStar(const ProofContext& ctx,
                         const SecurityLevel& level,
                         const LogStarStatement& statement,
                         const RingPedersenParams& verifier_params,
                         const LogStarProof& proof);

void AppendLogStarProof(const LogStarProof& proof, Bytes* out);
LogStarProof ReadLogStarProof(std::span<const uint8_t> input, size_t* offset);

}  // namespace cggmp
