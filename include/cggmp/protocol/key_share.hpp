#pragma once

#include <memory>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/ec_point.hpp"
#include "cggmp/crypto/paillier.hpp"
#include "cggmp/crypto/ring_pedersen.hpp"
#include "cggmp/crypto/scalar.hpp"
#include "cggmp/protocol/types.hpp"

namespace cggmp {

constexpr size_t kChainCodeLen = 32;

// Present on threshold shares: x_i are evaluations of a degree t-1 polynomial
// at the party ids.
struct VssSetup {
  uint32_t threshold = 0;
};

// Public part of a key, identical for every holder.
struct KeyInfo {
  CurveId curve = CurveId::kSecp256k1;
  ECPoint shared_public_key;
  std::vector<PartyIndex> participants;
  std::unordered_map<PartyIndex, ECPoint> public_shares;
  std::optional<VssSetup> vss_setup;
  std::optional<Bytes> chain_code;

  // Minimum signer count: t for threshold keys, n otherwise.
  uint32_t min_signers() const;
};

struct CoreKeyShare {
  PartyIndex i = 0;
  Scalar x;
  KeyInfo key_info;

  // Throws LocalValidationError when the share does not match its public data.
  void Validate() const;
};

struct PartyAuxInfo {
  PaillierPublicKey paillier;
  RingPedersenParams pedersen;
};

// Long-lived Paillier key and every party's public parameters. The private
// key belongs to this party alone.
struct AuxInfo {
  PartyIndex i = 0;
  std::shared_ptr<const PaillierProvider> paillier;
  std::unordered_map<PartyIndex, PartyAuxInfo> parties;

  void Validate(const std::vector<PartyIndex>& participants) const;
};

struct KeyShare {
  CoreKeyShare core;
  AuxInfo aux;

  void Validate() const;
};

// Public share a signer uses once ids in signers are fixed: lambda_j * X_j
// for threshold keys, X_j for additive ones.
ECPoint SignerPublicShare(const KeyInfo& key_info, const std::vector<PartyIndex>& signers, PartyIndex j);

Bytes EncodeKeyInfo(const KeyInfo& key_info);
KeyInfo DecodeKeyInfo(std::span<const uint8_t> encoded);
Bytes EncodeCoreKeyShare(const CoreKeyShare& share);
CoreKeyShare DecodeCoreKeyShare(std::span<const uint8_t> encoded);
// Versioned, length-prefixed encodings. The aux info blob carries the local
// Paillier factors and every party's (N, s, t); decoding rebuilds the
// Paillier key and validates the result.
Bytes EncodeAuxInfo(const AuxInfo& aux);
AuxInfo DecodeAuxInfo(std::span<const uint8_t> encoded);
Bytes EncodeKeyShare(const KeyShare& share);
KeyShare DecodeKeyShare(std::span<const uint8_t> encoded);
// Canonical digest of the public key data, stable across re-encodings.
Bytes HashKeyInfo(const KeyInfo& key_info);

}  // namespace cggmp
