#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <gmpxx.h>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/ec_point.hpp"
#include "cggmp/crypto/scalar.hpp"

namespace cggmp {

constexpr size_t kPointCompressedLen = 33;
constexpr size_t kScalarLen = 32;
constexpr size_t kMaxMpzFieldLen = 8192;

void AppendU32Be(uint32_t value, Bytes* out);
uint32_t ReadU32Be(std::span<const uint8_t> input, size_t* offset);

void AppendSizedField(std::span<const uint8_t> field, Bytes* out);
Bytes ReadSizedField(std::span<const uint8_t> input,
                     size_t* offset,
                     size_t max_len,
                     const char* field_name);
Bytes ReadFixedField(std::span<const uint8_t> input,
                     size_t* offset,
                     size_t len,
                     const char* field_name);

void AppendPoint(const ECPoint& point, Bytes* out);
ECPoint ReadPoint(std::span<const uint8_t> input, size_t* offset);

void AppendScalar(const Scalar& scalar, Bytes* out);
Scalar ReadScalar(std::span<const uint8_t> input, size_t* offset);

void AppendMpzField(const mpz_class& value, Bytes* out);
mpz_class ReadMpzField(std::span<const uint8_t> input,
                       size_t* offset,
                       size_t max_len,
                       const char* field_name);

void AppendSignedMpzField(const mpz_class& value, Bytes* out);
mpz_class ReadSignedMpzField(std::span<const uint8_t> input,
                             size_t* offset,
                             size_t max_len,
                             const char* field_name);

void EnsureFullyConsumed(std::span<const uint8_t> input, size_t offset, const char* what);

}  // namespace cggmp
