#include "cggmp/crypto/ec_point.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

extern "C" {
#include <secp256k1.h>
}

#include "cggmp/crypto/secp256k1_context.hpp"

namespace cggmp {
namespace {

secp256k1_pubkey ParsePubkey(const std::array<uint8_t, 33>& compressed) {
  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_parse(Secp256k1Context(), &pubkey, compressed.data(), compressed.size()) != 1) {
    throw std::invalid_argument("Compressed point is not a valid secp256k1 point");
  }
  return pubkey;
}

std::array<uint8_t, 33> SerializeCompressed(const secp256k1_pubkey& pubkey) {
  std::array<uint8_t, 33> out{};
  size_t out_len = out.size();
  if (secp256k1_ec_pubkey_serialize(
          Secp256k1Context(), out.data(), &out_len, &pubkey, SECP256K1_EC_COMPRESSED) != 1 ||
      out_len != out.size()) {
    throw std::runtime_error("Failed to serialize secp256k1 point");
  }
  return out;
}

}  // namespace

ECPoint::ECPoint() {
  compressed_.fill(0);
}

ECPoint ECPoint::Infinity() {
  return ECPoint();
}

ECPoint ECPoint::Generator() {
  static const ECPoint kGenerator = GeneratorMultiply(Scalar::FromUint64(1));
  return kGenerator;
}

ECPoint ECPoint::FromCompressed(std::span<const uint8_t> compressed_bytes) {
  if (compressed_bytes.size() != 33) {
    throw std::invalid_argument("Compressed point must be 33 bytes");
  }

  std::array<uint8_t, 33> compressed{};
  std::copy(compressed_bytes.begin(), compressed_bytes.end(), compressed.begin());

  ECPoint out;
  if (std::all_of(compressed.begin(), compressed.end(), [](uint8_t b) { return b == 0; })) {
    return out;
  }
  (void)ParsePubkey(compressed);
  out.compressed_ = compressed;
  return out;
}

ECPoint ECPoint::GeneratorMultiply(const Scalar& scalar) {
  if (scalar.IsZero()) {
    return Infinity();
  }
  std::array<uint8_t, 32> scalar_bytes = scalar.ToCanonicalBytes();

  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_create(Secp256k1Context(), &pubkey, scalar_bytes.data()) != 1) {
    throw std::invalid_argument("Generator multiplication failed");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(pubkey);
  return out;
}

bool ECPoint::IsInfinity() const {
  return compressed_[0] == 0;
}

ECPoint ECPoint::Add(const ECPoint& other) const {
  if (IsInfinity()) {
    return other;
  }
  if (other.IsInfinity()) {
    return *this;
  }

  secp256k1_pubkey lhs = ParsePubkey(compressed_);
  secp256k1_pubkey rhs = ParsePubkey(other.compressed_);

  const secp256k1_pubkey* inputs[2] = {&lhs, &rhs};
  secp256k1_pubkey combined;
  if (secp256k1_ec_pubkey_combine(Secp256k1Context(), &combined, inputs, 2) != 1) {
    // combine only fails when the sum is the point at infinity.
    return Infinity();
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(combined);
  return out;
}

ECPoint ECPoint::Sub(const ECPoint& other) const {
  return Add(other.Negate());
}

ECPoint ECPoint::Mul(const Scalar& scalar) const {
  if (IsInfinity() || scalar.IsZero()) {
    return Infinity();
  }

  secp256k1_pubkey pubkey = ParsePubkey(compressed_);
  std::array<uint8_t, 32> scalar_bytes = scalar.ToCanonicalBytes();

  if (secp256k1_ec_pubkey_tweak_mul(Secp256k1Context(), &pubkey, scalar_bytes.data()) != 1) {
    throw std::invalid_argument("Point scalar multiplication failed");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(pubkey);
  return out;
}

ECPoint ECPoint::Negate() const {
  if (IsInfinity()) {
    return *this;
  }

  secp256k1_pubkey pubkey = ParsePubkey(compressed_);
  if (secp256k1_ec_pubkey_negate(Secp256k1Context(), &pubkey) != 1) {
    throw std::runtime_error("Point negation failed");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(pubkey);
  return out;
}

Bytes ECPoint::ToCompressedBytes() const {
  return Bytes(compressed_.begin(), compressed_.end());
}

bool ECPoint::operator==(const ECPoint& other) const {
  return compressed_ == other.compressed_;
}

bool ECPoint::operator!=(const ECPoint& other) const {
  return !(*this == other);
}

}  // namespace cggmp
