#pragma once

#include <span>

#include "cggmp/common/bytes.hpp"

namespace cggmp {

Bytes Sha256(std::span<const uint8_t> data);
Bytes Sha512(std::span<const uint8_t> data);
Bytes HmacSha512(std::span<const uint8_t> key, std::span<const uint8_t> data);

}  // namespace cggmp
