#pragma once

#include <cstdint>
#include <span>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/ec_point.hpp"
#include "cggmp/crypto/scalar.hpp"
#include "cggmp/protocol/key_share.hpp"

namespace cggmp {

constexpr uint32_t kHardenedIndexBit = 0x80000000u;

// Public key and chain code reached by a non-hardened BIP-32 path, and the
// tweak that was added to the parent secret along the way.
struct DerivedKey {
  ECPoint public_key;
  Bytes chain_code;
  Scalar shift;
};

DerivedKey DeriveChildPublicKey(const ECPoint& parent, std::span<const uint8_t> chain_code, uint32_t index);

// Walks path from the shared public key of key_info. Throws
// LocalValidationError for hardened indices or a key without a chain code.
DerivedKey DeriveAdditiveShift(const KeyInfo& key_info, std::span<const uint32_t> path);

// Share of the child key: threshold shares move by the shift, additive shares
// by shift / n, and every public share follows.
CoreKeyShare DeriveChildKeyShare(const CoreKeyShare& share, std::span<const uint32_t> path);

}  // namespace cggmp
