#include "cggmp/crypto/bigint.hpp"

#include <algorithm>
#include <stdexcept>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/random.hpp"

namespace cggmp {
namespace {

constexpr int kPrimalityReps = 40;

}  // namespace

mpz_class RandomBelow(const mpz_class& upper_exclusive) {
  if (upper_exclusive <= 0) {
    throw std::invalid_argument("random upper bound must be positive");
  }

  const size_t bit_len = mpz_sizeinbase(upper_exclusive.get_mpz_t(), 2);
  const size_t byte_len = std::max<size_t>(1, (bit_len + 7) / 8);
  const unsigned int top_bits = static_cast<unsigned int>(bit_len % 8);

  while (true) {
    Bytes random = Csprng::RandomBytes(byte_len);
    if (top_bits != 0) {
      random.front() &= static_cast<uint8_t>((1U << top_bits) - 1U);
    }
    mpz_class candidate;
    mpz_import(candidate.get_mpz_t(), random.size(), 1, sizeof(uint8_t), 1, 0, random.data());
    if (candidate < upper_exclusive) {
      return candidate;
    }
  }
}

mpz_class RandomSignedRange(const mpz_class& bound) {
  if (bound < 0) {
    throw std::invalid_argument("signed range bound must be non-negative");
  }
  return RandomBelow(2 * bound + 1) - bound;
}

mpz_class RandomSignedBits(size_t bits) {
  return RandomSignedRange(TwoPow(bits));
}

mpz_class RandomZnStar(const mpz_class& modulus) {
  if (modulus <= 2) {
    throw std::invalid_argument("modulus must be > 2");
  }

  while (true) {
    const mpz_class candidate = RandomBelow(modulus);
    if (IsZnStarElement(candidate, modulus)) {
      return candidate;
    }
  }
}

bool IsZnStarElement(const mpz_class& value, const mpz_class& modulus) {
  if (value <= 0 || value >= modulus) {
    return false;
  }
  mpz_class gcd;
  mpz_gcd(gcd.get_mpz_t(), value.get_mpz_t(), modulus.get_mpz_t());
  return gcd == 1;
}

bool IsInSignedRange(const mpz_class& value, const mpz_class& bound) {
  return abs(value) <= bound;
}

mpz_class TwoPow(size_t bits) {
  mpz_class out;
  mpz_ui_pow_ui(out.get_mpz_t(), 2, bits);
  return out;
}

size_t BitLength(const mpz_class& value) {
  if (value == 0) {
    return 0;
  }
  return mpz_sizeinbase(value.get_mpz_t(), 2);
}

mpz_class NormalizeMod(const mpz_class& value, const mpz_class& modulus) {
  mpz_class out = value % modulus;
  if (out < 0) {
    out += modulus;
  }
  return out;
}

mpz_class MulMod(const mpz_class& lhs, const mpz_class& rhs, const mpz_class& modulus) {
  return NormalizeMod(lhs * rhs, modulus);
}

mpz_class PowMod(const mpz_class& base, const mpz_class& exp, const mpz_class& modulus) {
  if (exp < 0) {
    throw std::invalid_argument("modular exponent must be non-negative");
  }
  mpz_class out;
  mpz_powm(out.get_mpz_t(), base.get_mpz_t(), exp.get_mpz_t(), modulus.get_mpz_t());
  return out;
}

mpz_class PowModSigned(const mpz_class& base, const mpz_class& exp, const mpz_class& modulus) {
  if (exp >= 0) {
    return PowMod(base, exp, modulus);
  }

  const std::optional<mpz_class> inverse = InvertMod(base, modulus);
  if (!inverse.has_value()) {
    throw std::invalid_argument("base is not invertible for negative exponent");
  }
  return PowMod(*inverse, -exp, modulus);
}

std::optional<mpz_class> InvertMod(const mpz_class& value, const mpz_class& modulus) {
  mpz_class inverse;
  if (mpz_invert(inverse.get_mpz_t(), value.get_mpz_t(), modulus.get_mpz_t()) == 0) {
    return std::nullopt;
  }
  return inverse;
}

int JacobiSymbol(const mpz_class& value, const mpz_class& modulus) {
  if (modulus <= 0 || mpz_even_p(modulus.get_mpz_t()) != 0) {
    throw std::invalid_argument("Jacobi symbol requires an odd positive modulus");
  }
  const mpz_class reduced = NormalizeMod(value, modulus);
  return mpz_jacobi(reduced.get_mpz_t(), modulus.get_mpz_t());
}

bool IsProbablePrime(const mpz_class& value) {
  return mpz_probab_prime_p(value.get_mpz_t(), kPrimalityReps) != 0;
}

mpz_class CenterMod(const mpz_class& value, const mpz_class& modulus) {
  mpz_class out = NormalizeMod(value, modulus);
  if (out > modulus / 2) {
    out -= modulus;
  }
  return out;
}

}  // namespace cggmp
