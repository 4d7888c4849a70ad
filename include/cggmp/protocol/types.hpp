#pragma once

#include <cstdint>
#include <vector>

namespace cggmp {

using PartyIndex = uint32_t;

// Sealed set of supported curves; shares carry it so a mismatch is detected before use.
enum class CurveId : uint32_t {
  kSecp256k1 = 1,
};

using PartySet = std::vector<PartyIndex>;

}  // namespace cggmp
