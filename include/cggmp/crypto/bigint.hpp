#pragma once

#include <cstddef>
#include <optional>

#include <gmpxx.h>

namespace cggmp {

mpz_class RandomBelow(const mpz_class& upper_exclusive);
// Uniform in [-bound, bound].
mpz_class RandomSignedRange(const mpz_class& bound);
// Uniform in [-2^bits, 2^bits].
mpz_class RandomSignedBits(size_t bits);
mpz_class RandomZnStar(const mpz_class& modulus);

bool IsZnStarElement(const mpz_class& value, const mpz_class& modulus);
// |value| <= bound
bool IsInSignedRange(const mpz_class& value, const mpz_class& bound);

mpz_class TwoPow(size_t bits);
size_t BitLength(const mpz_class& value);

mpz_class NormalizeMod(const mpz_class& value, const mpz_class& modulus);
mpz_class MulMod(const mpz_class& lhs, const mpz_class& rhs, const mpz_class& modulus);
mpz_class PowMod(const mpz_class& base, const mpz_class& exp, const mpz_class& modulus);
// Negative exponents go through the modular inverse of base.
mpz_class PowModSigned(const mpz_class& base, const mpz_class& exp, const mpz_class& modulus);
std::optional<mpz_class> InvertMod(const mpz_class& value, const mpz_class& modulus);

int JacobiSymbol(const mpz_class& value, const mpz_class& modulus);
bool IsProbablePrime(const mpz_class& value);

// Centres value mod modulus into (-modulus/2, modulus/2].
mpz_class CenterMod(const mpz_class& value, const mpz_class& modulus);

}  // namespace cggmp
