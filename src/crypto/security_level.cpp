#include "cggmp/crypto/security_level.hpp"

#include <string>

#include "cggmp/common/errors.hpp"
#include "cggmp/crypto/bigint.hpp"

namespace cggmp {
namespace {

mpz_class ChallengeModulus() {
  return TwoPow(256) - 1;
}

}  // namespace

SecurityLevel SecurityLevel::ReasonablySecure() {
  return SecurityLevel{
      .kappa = 256,
      .epsilon = 128,
      .ell = 128,
      .ell_prime = 128,
      .m = 30,
      .q = ChallengeModulus(),
      .paillier_bits = 2048,
  };
}

SecurityLevel SecurityLevel::DevelopmentOnly() {
  return SecurityLevel{
      .kappa = 32,
      .epsilon = 8,
      .ell = 16,
      .ell_prime = 16,
      .m = 10,
      .q = ChallengeModulus(),
      .paillier_bits = 1024,
  };
}

size_t SecurityLevel::EllBits() const {
  return 256 + ell;
}

size_t SecurityLevel::EllPrimeBits() const {
  return 512 + ell_prime;
}

size_t SecurityLevel::EpsilonBits() const {
  return BitLength(q) + epsilon;
}

void SecurityLevel::Validate() const {
  if (m == 0 || q <= 0) {
    throw LocalValidationError("security level requires m > 0 and q > 0");
  }
  const size_t needed = EllPrimeBits() + EpsilonBits() + 2;
  if (paillier_bits < needed) {
    throw LocalValidationError("Paillier modulus of " + std::to_string(paillier_bits) +
                               " bits cannot hold MtA plaintexts (need " + std::to_string(needed) + ")");
  }
}

}  // namespace cggmp
