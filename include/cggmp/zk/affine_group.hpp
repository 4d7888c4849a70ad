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

// D = C^x (1 + N0)^y rho^N0 mod N0^2, Y = enc_N1(y; rho_y), X = x*G with
// x in +-2^EllBits and y in +-2^EllPrimeBits.
struct AffineGroupStatement {
  PaillierPublicKey receiver_key;
  PaillierPublicKey prover_key;
  mpz_class c;
  mpz_class d;
  mpz_class y;
  ECPoint x;
};

struct AffineGroupWitness {
  mpz_class x;
  mpz_class y;
  mpz_class rho;
  mpz_class rho_y;
};

struct AffineGroupProof {
  mpz_class a;
  ECPoint b_x;
  mpz_class b_y;
  mpz_class e_commit;
  mpz_class s;
  mpz_class f;
  mpz_class t;
  mpz_class z1;
  mpz_class z2;
  mpz_class z3;
  mpz_class z4;
  mpz_class w;
  mpz_class w_y;
};

AffineGroupProof ProveAffineGroup(const ProofContext& ctx,
                                  const SecurityLevel& level,
                                  const AffineGroupStatement& statement,
                                  const AffineGroupWitness& witness,
                                  const RingPedersenParams& verifier_params);

ProofCheck VerifyAffineGroup(const ProofContext& ctx,
                             const SecurityLevel& level,
                             const AffineGroupStatement& statement,
                             const RingPedersenParams& verifier_params,
                             const AffineGroupProof& proof);

void AppendAffineGroupProof(const AffineGroupProof& proof, Bytes* out);
AffineGroupProof ReadAffineGroupProof(std::span<const uint8_t> input, size_t* offset);

}  // namespace cggmp
