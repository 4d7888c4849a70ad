#include "cggmp/protocol/key_share.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "cggmp/common/errors.hpp"
#include "cggmp/common/secure_zeroize.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/feldman.hpp"
#include "cggmp/crypto/hash.hpp"

namespace cggmp {
namespace {

constexpr uint32_t kKeyShareMagic = 0x43474b53;  // "CGKS"
constexpr uint32_t kKeyInfoMagic = 0x43474b49;   // "CGKI"
constexpr uint32_t kAuxInfoMagic = 0x43474158;   // "CGAX"
constexpr uint32_t kFullShareMagic = 0x43474653; // "CGFS"
constexpr uint32_t kEncodingVersion = 1;
constexpr uint32_t kMaxParties = 4096;
constexpr size_t kMaxKeyInfoLen = 1 << 20;
constexpr size_t kMaxAuxInfoLen = 1 << 24;
constexpr size_t kMaxModulusLen = 2048;
constexpr char kKeyInfoHashDomain[] = "CGGMP21/key-info/v1";

std::vector<PartyIndex> SortedIds(const std::vector<PartyIndex>& ids) {
  std::vector<PartyIndex> out = ids;
  std::sort(out.begin(), out.end());
  return out;
}

// Lagrange basis polynomial for base[j] evaluated at x.
Scalar LagrangeAt(const std::vector<PartyIndex>& base, PartyIndex j, PartyIndex x) {
  const Scalar x_scalar = Scalar::FromUint64(x);
  const Scalar j_scalar = Scalar::FromUint64(j);
  Scalar numerator = Scalar::FromUint64(1);
  Scalar denominator = Scalar::FromUint64(1);
  for (PartyIndex m : base) {
    if (m == j) {
      continue;
    }
    const Scalar m_scalar = Scalar::FromUint64(m);
    numerator = numerator * (x_scalar - m_scalar);
    denominator = denominator * (j_scalar - m_scalar);
  }
  const std::optional<Scalar> inv = denominator.Inverse();
  if (!inv.has_value()) {
    throw LocalValidationError("duplicate participant id in key info");
  }
  return numerator * *inv;
}

void ExpectHeader(std::span<const uint8_t> encoded, size_t* offset, uint32_t magic, const char* what) {
  if (ReadU32Be(encoded, offset) != magic) {
    throw std::invalid_argument(std::string(what) + " has a bad magic");
  }
  if (ReadU32Be(encoded, offset) != kEncodingVersion) {
    throw std::invalid_argument(std::string(what) + " has an unsupported version");
  }
}

void ValidateKeyInfo(const KeyInfo& info) {
  if (info.curve != CurveId::kSecp256k1) {
    throw LocalValidationError("key share is bound to an unsupported curve");
  }
  if (info.participants.size() < 2) {
    throw LocalValidationError("key info must name at least 2 participants");
  }

  std::unordered_set<PartyIndex> seen;
  for (PartyIndex id : info.participants) {
    if (id == 0 || !seen.insert(id).second) {
      throw LocalValidationError("key info participants must be unique and non-zero");
    }
    const auto it = info.public_shares.find(id);
    if (it == info.public_shares.end() || it->second.IsInfinity()) {
      throw LocalValidationError("missing public share for party " + std::to_string(id));
    }
  }
  if (info.public_shares.size() != info.participants.size()) {
    throw LocalValidationError("public shares do not match the participant set");
  }
  if (info.shared_public_key.IsInfinity()) {
    throw LocalValidationError("shared public key is the point at infinity");
  }
  if (info.chain_code.has_value() && info.chain_code->size() != kChainCodeLen) {
    throw LocalValidationError("chain code must be 32 bytes");
  }

  if (!info.vss_setup.has_value()) {
    std::vector<ECPoint> shares;
    for (PartyIndex id : info.participants) {
      shares.push_back(info.public_shares.at(id));
    }
    if (SumPoints(shares) != info.shared_public_key) {
      throw LocalValidationError("public shares do not sum to the shared public key");
    }
    return;
  }

  const uint32_t t = info.vss_setup->threshold;
  if (t < 2 || t > info.participants.size()) {
    throw LocalValidationError("threshold must be within [2, n]");
  }

  const std::vector<PartyIndex> base(info.participants.begin(), info.participants.begin() + t);
  std::vector<ECPoint> terms;
  for (PartyIndex j : base) {
    terms.push_back(info.public_shares.at(j).Mul(LagrangeAt(base, j, 0)));
  }
  if (SumPoints(terms) != info.shared_public_key) {
    throw LocalValidationError("public shares do not interpolate to the shared public key");
  }
  for (size_t k = t; k < info.participants.size(); ++k) {
    const PartyIndex x = info.participants[k];
    std::vector<ECPoint> at_x;
    for (PartyIndex j : base) {
      at_x.push_back(info.public_shares.at(j).Mul(LagrangeAt(base, j, x)));
    }
    if (SumPoints(at_x) != info.public_shares.at(x)) {
      throw LocalValidationError("public share of party " + std::to_string(x) +
                                 " is inconsistent with a degree t-1 sharing");
    }
  }
}

}  // namespace

uint32_t KeyInfo::min_signers() const {
  if (vss_setup.has_value()) {
    return vss_setup->threshold;
  }
  return static_cast<uint32_t>(participants.size());
}

void CoreKeyShare::Validate() const {
  ValidateKeyInfo(key_info);
  const auto it = key_info.public_shares.find(i);
  if (it == key_info.public_shares.end()) {
    throw LocalValidationError("share index is not a participant");
  }
  if (x.IsZero() || ECPoint::GeneratorMultiply(x) != it->second) {
    throw LocalValidationError("secret share does not match its public share");
  }
}

void AuxInfo::Validate(const std::vector<PartyIndex>& participants) const {
  if (paillier == nullptr) {
    throw LocalValidationError("aux info has no local Paillier key");
  }
  const auto self_it = parties.find(i);
  if (self_it == parties.end() || self_it->second.paillier.n != paillier->modulus_n()) {
    throw LocalValidationError("aux info does not match the local Paillier key");
  }
  for (PartyIndex id : participants) {
    const auto it = parties.find(id);
    if (it == parties.end()) {
      throw LocalValidationError("aux info missing for party " + std::to_string(id));
    }
    if (it->second.paillier.n != it->second.pedersen.n || !it->second.pedersen.IsWellFormed()) {
      throw LocalValidationError("aux info of party " + std::to_string(id) + " is malformed");
    }
  }
}

void KeyShare::Validate() const {
  core.Validate();
  if (aux.i != core.i) {
    throw LocalValidationError("aux info belongs to a different party");
  }
  aux.Validate(core.key_info.participants);
}

ECPoint SignerPublicShare(const KeyInfo& key_info, const std::vector<PartyIndex>& signers, PartyIndex j) {
  const ECPoint& x_j = key_info.public_shares.at(j);
  if (!key_info.vss_setup.has_value()) {
    return x_j;
  }
  return x_j.Mul(LagrangeCoefficientAtZero(signers, j));
}

Bytes EncodeKeyInfo(const KeyInfo& key_info) {
  Bytes out;
  AppendU32Be(kKeyInfoMagic, &out);
  AppendU32Be(kEncodingVersion, &out);
  AppendU32Be(static_cast<uint32_t>(key_info.curve), &out);
  AppendPoint(key_info.shared_public_key, &out);

  const std::vector<PartyIndex> ids = SortedIds(key_info.participants);
  AppendU32Be(static_cast<uint32_t>(ids.size()), &out);
  for (PartyIndex id : ids) {
    AppendU32Be(id, &out);
    AppendPoint(key_info.public_shares.at(id), &out);
  }

  out.push_back(key_info.vss_setup.has_value() ? 1 : 0);
  if (key_info.vss_setup.has_value()) {
    AppendU32Be(key_info.vss_setup->threshold, &out);
  }
  out.push_back(key_info.chain_code.has_value() ? 1 : 0);
  if (key_info.chain_code.has_value()) {
    AppendSizedField(*key_info.chain_code, &out);
  }
  return out;
}

KeyInfo DecodeKeyInfo(std::span<const uint8_t> encoded) {
  size_t offset = 0;
  if (ReadU32Be(encoded, &offset) != kKeyInfoMagic) {
    throw std::invalid_argument("key info has a bad magic");
  }
  if (ReadU32Be(encoded, &offset) != kEncodingVersion) {
    throw std::invalid_argument("key info has an unsupported version");
  }

  KeyInfo out;
  out.curve = static_cast<CurveId>(ReadU32Be(encoded, &offset));
  out.shared_public_key = ReadPoint(encoded, &offset);

  const uint32_t count = ReadU32Be(encoded, &offset);
  if (count > kMaxParties) {
    throw std::invalid_argument("key info names too many parties");
  }
  for (uint32_t k = 0; k < count; ++k) {
    const PartyIndex id = ReadU32Be(encoded, &offset);
    out.participants.push_back(id);
    out.public_shares[id] = ReadPoint(encoded, &offset);
  }

  const Bytes vss_flag = ReadFixedField(encoded, &offset, 1, "vss flag");
  if (vss_flag[0] > 1) {
    throw std::invalid_argument("key info vss flag must be 0 or 1");
  }
  if (vss_flag[0] == 1) {
    out.vss_setup = VssSetup{.threshold = ReadU32Be(encoded, &offset)};
  }
  const Bytes chain_flag = ReadFixedField(encoded, &offset, 1, "chain code flag");
  if (chain_flag[0] > 1) {
    throw std::invalid_argument("key info chain code flag must be 0 or 1");
  }
  if (chain_flag[0] == 1) {
    out.chain_code = ReadSizedField(encoded, &offset, kChainCodeLen, "chain code");
  }
  EnsureFullyConsumed(encoded, offset, "KeyInfo");
  return out;
}

Bytes EncodeCoreKeyShare(const CoreKeyShare& share) {
  Bytes out;
  AppendU32Be(kKeyShareMagic, &out);
  AppendU32Be(kEncodingVersion, &out);
  AppendU32Be(share.i, &out);
  AppendScalar(share.x, &out);
  AppendSizedField(EncodeKeyInfo(share.key_info), &out);
  return out;
}

CoreKeyShare DecodeCoreKeyShare(std::span<const uint8_t> encoded) {
  size_t offset = 0;
  if (ReadU32Be(encoded, &offset) != kKeyShareMagic) {
    throw std::invalid_argument("key share has a bad magic");
  }
  if (ReadU32Be(encoded, &offset) != kEncodingVersion) {
    throw std::invalid_argument("key share has an unsupported version");
  }

  CoreKeyShare out;
  out.i = ReadU32Be(encoded, &offset);
  out.x = ReadScalar(encoded, &offset);
  const Bytes info = ReadSizedField(encoded, &offset, kMaxKeyInfoLen, "key info");
  out.key_info = DecodeKeyInfo(info);
  EnsureFullyConsumed(encoded, offset, "CoreKeyShare");
  out.Validate();
  return out;
}

Bytes EncodeAuxInfo(const AuxInfo& aux) {
  if (aux.paillier == nullptr) {
    throw LocalValidationError("aux info has no local Paillier key");
  }
  Bytes out;
  AppendU32Be(kAuxInfoMagic, &out);
  AppendU32Be(kEncodingVersion, &out);
  AppendU32Be(aux.i, &out);
  AppendMpzField(aux.paillier->prime_p(), &out);
  AppendMpzField(aux.paillier->prime_q(), &out);

  std::vector<PartyIndex> ids;
  for (const auto& entry : aux.parties) {
    ids.push_back(entry.first);
  }
  std::sort(ids.begin(), ids.end());
  AppendU32Be(static_cast<uint32_t>(ids.size()), &out);
  for (PartyIndex id : ids) {
    const PartyAuxInfo& party = aux.parties.at(id);
    if (party.pedersen.n != party.paillier.n) {
      throw LocalValidationError("aux info of party " + std::to_string(id) + " is malformed");
    }
    AppendU32Be(id, &out);
    AppendMpzField(party.paillier.n, &out);
    AppendMpzField(party.pedersen.s, &out);
    AppendMpzField(party.pedersen.t, &out);
  }
  return out;
}

AuxInfo DecodeAuxInfo(std::span<const uint8_t> encoded) {
  size_t offset = 0;
  ExpectHeader(encoded, &offset, kAuxInfoMagic, "aux info");

  AuxInfo out;
  out.i = ReadU32Be(encoded, &offset);
  mpz_class p = ReadMpzField(encoded, &offset, kMaxModulusLen, "paillier p");
  mpz_class q = ReadMpzField(encoded, &offset, kMaxModulusLen, "paillier q");
  ScopedZeroize<mpz_class> wipe_p(&p);
  ScopedZeroize<mpz_class> wipe_q(&q);

  const uint32_t count = ReadU32Be(encoded, &offset);
  if (count > kMaxParties) {
    throw std::invalid_argument("aux info names too many parties");
  }
  std::vector<PartyIndex> ids;
  for (uint32_t k = 0; k < count; ++k) {
    const PartyIndex id = ReadU32Be(encoded, &offset);
    PartyAuxInfo party;
    party.paillier.n = ReadMpzField(encoded, &offset, kMaxModulusLen, "paillier modulus");
    party.pedersen.n = party.paillier.n;
    party.pedersen.s = ReadMpzField(encoded, &offset, kMaxModulusLen, "ring-pedersen s");
    party.pedersen.t = ReadMpzField(encoded, &offset, kMaxModulusLen, "ring-pedersen t");
    if (!out.parties.emplace(id, std::move(party)).second) {
      throw std::invalid_argument("aux info lists party " + std::to_string(id) + " twice");
    }
    ids.push_back(id);
  }
  EnsureFullyConsumed(encoded, offset, "AuxInfo");

  out.paillier = std::make_shared<const PaillierProvider>(PaillierProvider::FromFactors(p, q));
  out.Validate(ids);
  return out;
}

Bytes EncodeKeyShare(const KeyShare& share) {
  Bytes out;
  AppendU32Be(kFullShareMagic, &out);
  AppendU32Be(kEncodingVersion, &out);
  Bytes core = EncodeCoreKeyShare(share.core);
  AppendSizedField(core, &out);
  SecureZeroize(&core);
  Bytes aux = EncodeAuxInfo(share.aux);
  AppendSizedField(aux, &out);
  SecureZeroize(&aux);
  return out;
}

KeyShare DecodeKeyShare(std::span<const uint8_t> encoded) {
  size_t offset = 0;
  ExpectHeader(encoded, &offset, kFullShareMagic, "key share");

  Bytes core = ReadSizedField(encoded, &offset, kMaxKeyInfoLen, "core key share");
  ScopedZeroize<Bytes> wipe_core(&core);
  Bytes aux = ReadSizedField(encoded, &offset, kMaxAuxInfoLen, "aux info");
  ScopedZeroize<Bytes> wipe_aux(&aux);
  EnsureFullyConsumed(encoded, offset, "KeyShare");

  KeyShare out{.core = DecodeCoreKeyShare(core), .aux = DecodeAuxInfo(aux)};
  out.Validate();
  return out;
}

Bytes HashKeyInfo(const KeyInfo& key_info) {
  Bytes preimage;
  AppendSizedField(AsByteSpan(kKeyInfoHashDomain), &preimage);
  AppendSizedField(EncodeKeyInfo(key_info), &preimage);
  return Sha256(preimage);
}

}  // namespace cggmp
