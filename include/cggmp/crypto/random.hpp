#pragma once

#include <cstddef>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/scalar.hpp"

namespace cggmp {

class Csprng {
 public:
  static Bytes RandomBytes(size_t size);
  static Scalar RandomScalar();
  static Scalar RandomNonZeroScalar();
};

}  // namespace cggmp
