#pragma once

#include <gmpxx.h>

#include "cggmp/crypto/paillier.hpp"

namespace cggmp {

// Commitment bases (s, t) in Z*_N with t = s^lambda.
struct RingPedersenParams {
  mpz_class n;
  mpz_class s;
  mpz_class t;

  // s^x t^mu mod N for signed exponents.
  mpz_class Commit(const mpz_class& x, const mpz_class& mu) const;
  bool IsWellFormed() const;

  bool operator==(const RingPedersenParams& other) const {
    return n == other.n && s == other.s && t == other.t;
  }
};

struct RingPedersenWitness {
  mpz_class lambda;
  mpz_class phi;
};

struct RingPedersenSetup {
  RingPedersenParams params;
  RingPedersenWitness witness;
};

// Samples (s, t, lambda) over the modulus of an existing Paillier key.
RingPedersenSetup GenerateRingPedersen(const PaillierProvider& paillier);

}  // namespace cggmp
