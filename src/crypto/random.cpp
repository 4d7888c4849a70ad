#include "cggmp/crypto/random.hpp"

#include <stdexcept>

#include <openssl/rand.h>

#include "cggmp/common/errors.hpp"

namespace cggmp {

Bytes Csprng::RandomBytes(size_t size) {
  Bytes out(size);
  if (size == 0) {
    return out;
  }

  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw CryptoFailure("RAND_bytes failed");
  }
  return out;
}

Scalar Csprng::RandomScalar() {
  while (true) {
    const Bytes bytes = RandomBytes(32);
    try {
      return Scalar::FromCanonicalBytes(bytes);
    } catch (const std::invalid_argument&) {
      continue;
    }
  }
}

Scalar Csprng::RandomNonZeroScalar() {
  while (true) {
    Scalar out = RandomScalar();
    if (!out.IsZero()) {
      return out;
    }
  }
}

}  // namespace cggmp
