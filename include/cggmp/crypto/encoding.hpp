#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <gmpxx.h>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/ec_point.hpp"

namespace cggmp {

// u32 length followed by the big-endian magnitude; zero encodes as one 0x00 byte.
Bytes EncodeMpz(const mpz_class& value);
mpz_class DecodeMpz(std::span<const uint8_t> encoded, size_t max_len = 8192);

// Sign byte (0x00 non-negative, 0x01 negative) followed by EncodeMpz(|value|).
Bytes EncodeSignedMpz(const mpz_class& value);
mpz_class DecodeSignedMpz(std::span<const uint8_t> encoded, size_t max_len = 8192);

// Big-endian magnitude left-padded to exactly width bytes.
Bytes ExportFixedWidth(const mpz_class& value, size_t width);

Bytes EncodePoint(const ECPoint& point);
ECPoint DecodePoint(std::span<const uint8_t> encoded);

}  // namespace cggmp
