#pragma once

#include <array>
#include <cstdint>
#include <span>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/scalar.hpp"

namespace cggmp {

// secp256k1 point held in compressed form. The point at infinity is the
// all-zero encoding and is also what a default-constructed point holds.
class ECPoint {
 public:
  ECPoint();

  static ECPoint Infinity();
  static ECPoint Generator();
  static ECPoint FromCompressed(std::span<const uint8_t> compressed_bytes);
  static ECPoint GeneratorMultiply(const Scalar& scalar);

  bool IsInfinity() const;

  ECPoint Add(const ECPoint& other) const;
  ECPoint Sub(const ECPoint& other) const;
  ECPoint Mul(const Scalar& scalar) const;
  ECPoint Negate() const;

  Bytes ToCompressedBytes() const;

  bool operator==(const ECPoint& other) const;
  bool operator!=(const ECPoint& other) const;

 private:
  std::array<uint8_t, 33> compressed_{};
};

}  // namespace cggmp
