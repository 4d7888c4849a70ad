#pragma once

#include <span>
#include <vector>

#include <gmpxx.h>

#include "cggmp/common/bytes.hpp"
#include "cggmp/zk/proof_context.hpp"

namespace cggmp {

// N is a Paillier-Blum modulus: gcd(N, phi(N)) = 1 and N = pq with
// p = q = 3 (mod 4).
struct PaillierModRound {
  mpz_class x;
  bool a = false;
  bool b = false;
  mpz_class z;
};

struct PaillierModProof {
  mpz_class w;
  std::vector<PaillierModRound> rounds;
};

PaillierModProof ProvePaillierMod(const ProofContext& ctx,
                                  const mpz_class& n,
                                  const mpz_class& p,
                                  const mpz_class& q,
                                  uint32_t repetitions);

ProofCheck VerifyPaillierMod(const ProofContext& ctx,
                             const mpz_class& n,
                             const PaillierModProof& proof,
                             uint32_t repetitions);

void AppendPaillierModProof(const PaillierModProof& proof, Bytes* out);
PaillierModProof ReadPaillierModProof(std::span<const uint8_t> input, size_t* offset);

}  // namespace cggmp
