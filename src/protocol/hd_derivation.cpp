#include "cggmp/protocol/hd_derivation.hpp"

#include <stdexcept>
#include <string>

#include "cggmp/common/errors.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/hash.hpp"

namespace cggmp {

DerivedKey DeriveChildPublicKey(const ECPoint& parent, std::span<const uint8_t> chain_code, uint32_t index) {
  if ((index & kHardenedIndexBit) != 0) {
    throw LocalValidationError("hardened index " + std::to_string(index) + " needs the full private key");
  }
  if (chain_code.size() != kChainCodeLen) {
    throw LocalValidationError("chain code must be 32 bytes");
  }
  if (parent.IsInfinity()) {
    throw LocalValidationError("cannot derive from the point at infinity");
  }

  Bytes data = parent.ToCompressedBytes();
  AppendU32Be(index, &data);
  const Bytes digest = HmacSha512(chain_code, data);
  const std::span<const uint8_t> left(digest.data(), 32);

  DerivedKey out;
  try {
    out.shift = Scalar::FromCanonicalBytes(left);
  } catch (const std::invalid_argument&) {
    throw LocalValidationError("derived tweak for index " + std::to_string(index) + " is not below q");
  }
  out.public_key = parent.Add(ECPoint::GeneratorMultiply(out.shift));
  if (out.public_key.IsInfinity()) {
    throw LocalValidationError("child key for index " + std::to_string(index) + " is the point at infinity");
  }
  out.chain_code.assign(digest.begin() + 32, digest.end());
  return out;
}

DerivedKey DeriveAdditiveShift(const KeyInfo& key_info, std::span<const uint32_t> path) {
  if (!key_info.chain_code.has_value()) {
    throw LocalValidationError("key share has no chain code");
  }

  DerivedKey out;
  out.public_key = key_info.shared_public_key;
  out.chain_code = *key_info.chain_code;
  for (uint32_t index : path) {
    const DerivedKey step = DeriveChildPublicKey(out.public_key, out.chain_code, index);
    out.public_key = step.public_key;
    out.chain_code = step.chain_code;
    out.shift = out.shift + step.shift;
  }
  return out;
}

CoreKeyShare DeriveChildKeyShare(const CoreKeyShare& share, std::span<const uint32_t> path) {
  share.Validate();
  const DerivedKey derived = DeriveAdditiveShift(share.key_info, path);

  Scalar per_party = derived.shift;
  if (!share.key_info.vss_setup.has_value()) {
    const Scalar n = Scalar::FromUint64(share.key_info.participants.size());
    per_party = derived.shift * *n.Inverse();
  }
  const ECPoint per_party_point = ECPoint::GeneratorMultiply(per_party);

  CoreKeyShare out = share;
  out.x = share.x + per_party;
  out.key_info.shared_public_key = derived.public_key;
  out.key_info.chain_code = derived.chain_code;
  for (auto& [id, public_share] : out.key_info.public_shares) {
    (void)id;
    public_share = public_share.Add(per_party_point);
  }
  out.Validate();
  return out;
}

}  // namespace cggmp
