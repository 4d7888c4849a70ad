#include "cggmp/protocol/sign_session.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include "cggmp/common/secure_zeroize.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/secp256k1_context.hpp"
#include "cggmp/protocol/hd_derivation.hpp"

namespace cggmp {
namespace {

constexpr size_t kMessageHashLen = 32;

std::vector<PartyIndex> SignersOf(const SignSessionConfig& cfg) {
  if (!cfg.presignature.has_value()) {
    throw LocalValidationError("signing requires a presignature");
  }
  return cfg.presignature->signers();
}

Scalar XCoordinateModQ(const ECPoint& point) {
  const Bytes compressed = point.ToCompressedBytes();
  if (compressed.size() != kPointCompressedLen) {
    throw std::invalid_argument("invalid compressed point length");
  }

  const std::span<const uint8_t> x_bytes(compressed.data() + 1, 32);
  return Scalar::FromBigEndianModQ(x_bytes);
}

}  // namespace

std::array<uint8_t, 64> Signature::ToCompact() const {
  std::array<uint8_t, 64> out{};
  const std::array<uint8_t, 32> r_bytes = r.ToCanonicalBytes();
  const std::array<uint8_t, 32> s_bytes = s.ToCanonicalBytes();
  std::copy(r_bytes.begin(), r_bytes.end(), out.begin());
  std::copy(s_bytes.begin(), s_bytes.end(), out.begin() + 32);
  return out;
}

bool VerifySignature(const ECPoint& public_key, std::span<const uint8_t> msg32, const Signature& signature) {
  if (msg32.size() != kMessageHashLen) {
    return false;
  }
  if (signature.r.IsZero() || signature.s.IsZero() || public_key.IsInfinity()) {
    return false;
  }

  secp256k1_pubkey pubkey;
  const Bytes compressed = public_key.ToCompressedBytes();
  if (secp256k1_ec_pubkey_parse(Secp256k1Context(), &pubkey, compressed.data(), compressed.size()) != 1) {
    return false;
  }

  const std::array<uint8_t, 64> compact_sig = signature.ToCompact();
  secp256k1_ecdsa_signature parsed;
  if (secp256k1_ecdsa_signature_parse_compact(Secp256k1Context(), &parsed, compact_sig.data()) != 1) {
    return false;
  }

  return secp256k1_ecdsa_verify(Secp256k1Context(), &parsed, msg32.data(), &pubkey) == 1;
}

SignSession::SignSession(SignSessionConfig cfg)
    : RoundSession(std::move(cfg.session_id), cfg.self_id, SignersOf(cfg), cfg.timeout),
      message_hash_(std::move(cfg.message_hash)) {
  if (message_hash_.size() != kMessageHashLen) {
    throw LocalValidationError("message hash must be 32 bytes");
  }
  if (cfg.key_share.i != self_id()) {
    throw LocalValidationError("key share belongs to another party");
  }
  cfg.key_share.Validate();

  Presignature& presignature = *cfg.presignature;
  if (presignature.consumed()) {
    throw LocalValidationError("presignature was already used");
  }
  if (presignature.key_hash() != HashKeyInfo(cfg.key_share.key_info)) {
    throw LocalValidationError("presignature was generated for a different key");
  }

  if (cfg.derivation_path.empty()) {
    public_key_ = cfg.key_share.key_info.shared_public_key;
  } else {
    const DerivedKey derived = DeriveAdditiveShift(cfg.key_share.key_info, cfg.derivation_path);
    public_key_ = derived.public_key;
    shift_ = derived.shift;
  }

  r_point_ = presignature.r_point();
  r_ = XCoordinateModQ(r_point_);
  if (r_.IsZero()) {
    throw CryptoFailure("presignature has r = 0");
  }
  secrets_ = presignature.Consume();
}

SignSession::~SignSession() {
  secrets_.k.Zeroize();
  secrets_.chi.Zeroize();
}

const ECPoint& SignSession::public_key() const {
  return public_key_;
}

bool SignSession::HasResult() const {
  return result_.has_value();
}

const Signature& SignSession::result() const {
  if (!result_.has_value()) {
    throw std::logic_error("signature is not ready");
  }
  return *result_;
}

uint32_t SignSession::round_count() const {
  return 1;
}

const char* SignSession::protocol_name() const {
  return "sign";
}

std::vector<RoundMessageSpec> SignSession::ExpectedMessages(uint32_t round) const {
  (void)round;
  return {{static_cast<uint32_t>(SignMessageType::kPartial), MessageScope::kBroadcast}};
}

std::vector<Envelope> SignSession::BeginRound(uint32_t round) {
  (void)round;
  const Scalar m = Scalar::FromBigEndianModQ(message_hash_);
  // sigma_i = k_i * m + r * chi_i, plus r * shift * k_i under a derived key.
  Scalar sigma = secrets_.k * m + r_ * secrets_.chi + r_ * shift_ * secrets_.k;
  secrets_.k.Zeroize();
  secrets_.chi.Zeroize();

  partials_[self_id()] = sigma;
  Bytes payload;
  AppendScalar(sigma, &payload);
  return {MakeBroadcast(static_cast<uint32_t>(SignMessageType::kPartial), std::move(payload))};
}

void SignSession::ValidateMessage(uint32_t round, const Envelope& envelope) {
  (void)round;
  size_t offset = 0;
  const Scalar sigma = ReadScalar(envelope.payload, &offset);
  EnsureFullyConsumed(envelope.payload, offset, "partial signature");
  partials_[envelope.from] = sigma;
}

void SignSession::FinishRound(uint32_t round) {
  (void)round;
  Scalar s;
  for (PartyIndex id : participants()) {
    s = s + partials_.at(id);
  }
  if (s.IsZero()) {
    throw CryptoFailure("combined signature has s = 0");
  }
  if (s.IsHigh()) {
    s = -s;
  }

  Signature signature{.r = r_, .s = s};
  if (!VerifySignature(public_key_, message_hash_, signature)) {
    throw CryptoFailure("combined signature does not verify under the public key");
  }
  BOOST_LOG_TRIVIAL(debug) << str(boost::format("sign party %1%: signature ready from %2% signers") %
                                  self_id() % participants().size());
  result_ = std::move(signature);
}

}  // namespace cggmp
