#include "cggmp/common/wire.hpp"

#include <array>
#include <stdexcept>
#include <string>

#include "cggmp/crypto/encoding.hpp"

namespace cggmp {

void AppendU32Be(uint32_t value, Bytes* out) {
  out->push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<uint8_t>(value & 0xFF));
}

uint32_t ReadU32Be(std::span<const uint8_t> input, size_t* offset) {
  if (*offset + 4 > input.size()) {
    throw std::invalid_argument("Not enough bytes to read u32");
  }

  const size_t i = *offset;
  *offset += 4;
  return (static_cast<uint32_t>(input[i]) << 24) |
         (static_cast<uint32_t>(input[i + 1]) << 16) |
         (static_cast<uint32_t>(input[i + 2]) << 8) |
         static_cast<uint32_t>(input[i + 3]);
}

void AppendSizedField(std::span<const uint8_t> field, Bytes* out) {
  if (field.size() > UINT32_MAX) {
    throw std::invalid_argument("Sized field exceeds uint32 length");
  }
  AppendU32Be(static_cast<uint32_t>(field.size()), out);
  out->insert(out->end(), field.begin(), field.end());
}

Bytes ReadSizedField(std::span<const uint8_t> input,
                     size_t* offset,
                     size_t max_len,
                     const char* field_name) {
  const uint32_t len = ReadU32Be(input, offset);
  if (len > max_len) {
    throw std::invalid_argument(std::string(field_name) + " exceeds maximum length");
  }
  return ReadFixedField(input, offset, len, field_name);
}

Bytes ReadFixedField(std::span<const uint8_t> input,
                     size_t* offset,
                     size_t len,
                     const char* field_name) {
  if (*offset + len > input.size()) {
    throw std::invalid_argument(std::string(field_name) + " has inconsistent length");
  }

  Bytes out(input.begin() + static_cast<std::ptrdiff_t>(*offset),
            input.begin() + static_cast<std::ptrdiff_t>(*offset + len));
  *offset += len;
  return out;
}

void AppendPoint(const ECPoint& point, Bytes* out) {
  const Bytes encoded = EncodePoint(point);
  if (encoded.size() != kPointCompressedLen) {
    throw std::runtime_error("Encoded secp256k1 point must be 33 bytes");
  }
  out->insert(out->end(), encoded.begin(), encoded.end());
}

ECPoint ReadPoint(std::span<const uint8_t> input, size_t* offset) {
  if (*offset + kPointCompressedLen > input.size()) {
    throw std::invalid_argument("Not enough bytes for compressed secp256k1 point");
  }

  const std::span<const uint8_t> view = input.subspan(*offset, kPointCompressedLen);
  *offset += kPointCompressedLen;
  return DecodePoint(view);
}

void AppendScalar(const Scalar& scalar, Bytes* out) {
  const std::array<uint8_t, kScalarLen> encoded = scalar.ToCanonicalBytes();
  out->insert(out->end(), encoded.begin(), encoded.end());
}

Scalar ReadScalar(std::span<const uint8_t> input, size_t* offset) {
  if (*offset + kScalarLen > input.size()) {
    throw std::invalid_argument("Not enough bytes for scalar");
  }
  const std::span<const uint8_t> view = input.subspan(*offset, kScalarLen);
  *offset += kScalarLen;
  return Scalar::FromCanonicalBytes(view);
}

void AppendMpzField(const mpz_class& value, Bytes* out) {
  AppendSizedField(EncodeMpz(value), out);
}

mpz_class ReadMpzField(std::span<const uint8_t> input,
                       size_t* offset,
                       size_t max_len,
                       const char* field_name) {
  const Bytes encoded = ReadSizedField(input, offset, max_len + 4, field_name);
  return DecodeMpz(encoded, max_len);
}

void AppendSignedMpzField(const mpz_class& value, Bytes* out) {
  AppendSizedField(EncodeSignedMpz(value), out);
}

mpz_class ReadSignedMpzField(std::span<const uint8_t> input,
                             size_t* offset,
                             size_t max_len,
                             const char* field_name) {
  const Bytes encoded = ReadSizedField(input, offset, max_len + 5, field_name);
  return DecodeSignedMpz(encoded, max_len);
}

void EnsureFullyConsumed(std::span<const uint8_t> input, size_t offset, const char* what) {
  if (offset != input.size()) {
    throw std::invalid_argument(std::string(what) + " has trailing bytes");
  }
}

}  // namespace cggmp
