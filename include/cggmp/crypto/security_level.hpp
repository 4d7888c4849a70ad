#pragma once

#include <cstddef>
#include <cstdint>

#include <gmpxx.h>

namespace cggmp {

// Statistical and computational parameters shared by the proofs and the
// Paillier modulus size.
struct SecurityLevel {
  uint32_t kappa = 0;
  uint32_t epsilon = 0;
  uint32_t ell = 0;
  uint32_t ell_prime = 0;
  // Repetitions of the modulus proofs.
  uint32_t m = 0;
  mpz_class q;
  uint32_t paillier_bits = 0;

  static SecurityLevel ReasonablySecure();
  static SecurityLevel DevelopmentOnly();

  size_t EllBits() const;
  size_t EllPrimeBits() const;
  size_t EpsilonBits() const;

  // Throws LocalValidationError when the level is internally inconsistent.
  void Validate() const;
};

}  // namespace cggmp
