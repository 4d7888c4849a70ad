#include "cggmp/crypto/encoding.hpp"

#include <algorithm>
#include <stdexcept>

#include "cggmp/common/wire.hpp"

namespace cggmp {
namespace {

mpz_class ImportBigEndian(std::span<const uint8_t> bytes) {
  mpz_class out;
  mpz_import(out.get_mpz_t(), bytes.size(), 1, sizeof(uint8_t), 1, 0, bytes.data());
  return out;
}

Bytes ExportBigEndian(const mpz_class& value) {
  if (value < 0) {
    throw std::invalid_argument("mpz value must be non-negative");
  }

  if (value == 0) {
    return Bytes{0x00};
  }

  size_t count = 0;
  Bytes out((mpz_sizeinbase(value.get_mpz_t(), 2) + 7) / 8);
  mpz_export(out.data(), &count, 1, sizeof(uint8_t), 1, 0, value.get_mpz_t());
  out.resize(count);
  return out;
}

}  // namespace

Bytes EncodeMpz(const mpz_class& value) {
  const Bytes payload = ExportBigEndian(value);

  if (payload.size() > UINT32_MAX) {
    throw std::invalid_argument("mpz byte length exceeds uint32");
  }

  Bytes out;
  out.reserve(4 + payload.size());
  AppendU32Be(static_cast<uint32_t>(payload.size()), &out);
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

mpz_class DecodeMpz(std::span<const uint8_t> encoded, size_t max_len) {
  if (encoded.size() < 4) {
    throw std::invalid_argument("Encoded mpz is too short");
  }

  size_t offset = 0;
  const uint32_t payload_len = ReadU32Be(encoded, &offset);
  if (payload_len == 0) {
    throw std::invalid_argument("Encoded mpz payload length must be >= 1");
  }
  if (payload_len > max_len) {
    throw std::invalid_argument("Encoded mpz payload exceeds max_len");
  }
  if (encoded.size() != 4 + payload_len) {
    throw std::invalid_argument("Encoded mpz has inconsistent payload length");
  }

  return ImportBigEndian(encoded.subspan(4, payload_len));
}

Bytes EncodeSignedMpz(const mpz_class& value) {
  const mpz_class magnitude = abs(value);
  Bytes out;
  out.push_back(value < 0 ? 0x01 : 0x00);
  const Bytes body = EncodeMpz(magnitude);
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

mpz_class DecodeSignedMpz(std::span<const uint8_t> encoded, size_t max_len) {
  if (encoded.empty()) {
    throw std::invalid_argument("Encoded signed mpz is empty");
  }

  const uint8_t sign = encoded[0];
  if (sign > 0x01) {
    throw std::invalid_argument("Encoded signed mpz has invalid sign byte");
  }

  mpz_class magnitude = DecodeMpz(encoded.subspan(1), max_len);
  if (sign == 0x01) {
    if (magnitude == 0) {
      throw std::invalid_argument("Encoded signed mpz has negative zero");
    }
    return -magnitude;
  }
  return magnitude;
}

Bytes ExportFixedWidth(const mpz_class& value, size_t width) {
  const Bytes raw = ExportBigEndian(value);
  if (raw.size() > width) {
    throw std::invalid_argument("Value does not fit the requested width");
  }

  Bytes out(width, 0);
  std::copy(raw.begin(), raw.end(), out.begin() + static_cast<std::ptrdiff_t>(width - raw.size()));
  return out;
}

Bytes EncodePoint(const ECPoint& point) {
  return point.ToCompressedBytes();
}

ECPoint DecodePoint(std::span<const uint8_t> encoded) {
  return ECPoint::FromCompressed(encoded);
}

}  // namespace cggmp
