#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>

#include <gmpxx.h>

namespace cggmp {

// Element of the secp256k1 scalar field.
class Scalar {
 public:
  Scalar();
  explicit Scalar(const mpz_class& value);

  static Scalar FromUint64(uint64_t value);
  static Scalar FromBigEndianModQ(std::span<const uint8_t> bytes);
  static Scalar FromCanonicalBytes(std::span<const uint8_t> bytes);

  std::array<uint8_t, 32> ToCanonicalBytes() const;

  const mpz_class& value() const;
  bool IsZero() const;

  std::optional<Scalar> Inverse() const;
  bool IsHigh() const;

  Scalar operator+(const Scalar& other) const;
  Scalar operator-(const Scalar& other) const;
  Scalar operator*(const Scalar& other) const;
  Scalar operator-() const;

  bool operator==(const Scalar& other) const;
  bool operator!=(const Scalar& other) const;

  void Zeroize() noexcept;

  static const mpz_class& ModulusQ();

 private:
  mpz_class value_;
};

}  // namespace cggmp
