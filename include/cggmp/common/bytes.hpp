#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cggmp {

using Bytes = std::vector<uint8_t>;

inline std::span<const uint8_t> AsByteSpan(std::string_view value) {
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

inline std::string BytesToKey(std::span<const uint8_t> bytes) {
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::string ToHex(std::span<const uint8_t> bytes);

}  // namespace cggmp
