#include "cggmp/crypto/hash.hpp"

#include <array>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include "cggmp/common/errors.hpp"

namespace cggmp {

Bytes Sha256(std::span<const uint8_t> data) {
  std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};
  if (SHA256(data.data(), data.size(), digest.data()) == nullptr) {
    throw CryptoFailure("SHA256 failed");
  }
  return Bytes(digest.begin(), digest.end());
}

Bytes Sha512(std::span<const uint8_t> data) {
  std::array<uint8_t, SHA512_DIGEST_LENGTH> digest{};
  if (SHA512(data.data(), data.size(), digest.data()) == nullptr) {
    throw CryptoFailure("SHA512 failed");
  }
  return Bytes(digest.begin(), digest.end());
}

Bytes HmacSha512(std::span<const uint8_t> key, std::span<const uint8_t> data) {
  std::array<uint8_t, SHA512_DIGEST_LENGTH> digest{};
  unsigned int digest_len = 0;
  if (HMAC(EVP_sha512(), key.data(), static_cast<int>(key.size()), data.data(), data.size(),
           digest.data(), &digest_len) == nullptr ||
      digest_len != digest.size()) {
    throw CryptoFailure("HMAC-SHA512 failed");
  }
  return Bytes(digest.begin(), digest.end());
}

}  // namespace cggmp
