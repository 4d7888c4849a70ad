#include "cggmp/protocol/keygen_session.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include "cggmp/common/secure_zeroize.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/commitment.hpp"
#include "cggmp/crypto/random.hpp"
#include "cggmp/protocol/commit_reveal.hpp"

namespace cggmp {
namespace {

constexpr char kDecommitDomain[] = "CGGMP21/keygen/decommit";
constexpr size_t kNonceLen = 32;

uint32_t MessageType(KeygenMessageType type) {
  return static_cast<uint32_t>(type);
}

Scalar DecodeScalarPayload(std::span<const uint8_t> payload, const char* what) {
  size_t offset = 0;
  const Scalar out = ReadScalar(payload, &offset);
  EnsureFullyConsumed(payload, offset, what);
  return out;
}

Bytes EncodeScalarPayload(const Scalar& value) {
  Bytes out;
  AppendScalar(value, &out);
  return out;
}

}  // namespace

KeygenSession::KeygenSession(KeygenSessionConfig cfg)
    : RoundSession(std::move(cfg.session_id), cfg.self_id, std::move(cfg.participants), cfg.timeout),
      threshold_(cfg.threshold),
      hd_enabled_(cfg.hd_enabled),
      enforce_reliable_broadcast_(cfg.enforce_reliable_broadcast) {
  // A 1-of-n key would let one signer run alone, which presigning cannot do.
  if (threshold_.has_value() && (*threshold_ < 2 || *threshold_ > participants().size())) {
    throw LocalValidationError("threshold must be within [2, n]");
  }
}

KeygenSession::~KeygenSession() {
  polynomial_.Zeroize();
  SecureZeroize(&schnorr_commitment_.alpha);
  SecureZeroize(&shares_);
}

bool KeygenSession::threshold_mode() const {
  return threshold_.has_value();
}

uint32_t KeygenSession::threshold() const {
  return threshold_.value_or(static_cast<uint32_t>(participants().size()));
}

bool KeygenSession::HasResult() const {
  return result_.has_value();
}

const CoreKeyShare& KeygenSession::result() const {
  if (!result_.has_value()) {
    throw std::logic_error("keygen result is not ready");
  }
  return *result_;
}

uint32_t KeygenSession::round_count() const {
  return enforce_reliable_broadcast_ ? 4 : 3;
}

const char* KeygenSession::protocol_name() const {
  return "keygen";
}

KeygenSession::Stage KeygenSession::StageOf(uint32_t round) const {
  if (!enforce_reliable_broadcast_ && round >= 2) {
    ++round;
  }
  switch (round) {
    case 1:
      return Stage::kCommit;
    case 2:
      return Stage::kEcho;
    case 3:
      return Stage::kDecommit;
    case 4:
      return Stage::kSchnorr;
    default:
      throw std::logic_error("keygen round out of range");
  }
}

std::vector<RoundMessageSpec> KeygenSession::ExpectedMessages(uint32_t round) const {
  switch (StageOf(round)) {
    case Stage::kCommit:
      return {{MessageType(KeygenMessageType::kCommit), MessageScope::kBroadcast}};
    case Stage::kEcho:
      return {{MessageType(KeygenMessageType::kEcho), MessageScope::kBroadcast}};
    case Stage::kDecommit:
      if (threshold_mode()) {
        return {{MessageType(KeygenMessageType::kDecommit), MessageScope::kBroadcast},
                {MessageType(KeygenMessageType::kShare), MessageScope::kDirect}};
      }
      return {{MessageType(KeygenMessageType::kDecommit), MessageScope::kBroadcast}};
    case Stage::kSchnorr:
      return {{MessageType(KeygenMessageType::kSchnorr), MessageScope::kBroadcast}};
  }
  return {};
}

std::vector<Envelope> KeygenSession::BeginRound(uint32_t round) {
  std::vector<Envelope> out;
  switch (StageOf(round)) {
    case Stage::kCommit: {
      // n-of-n parties share a constant polynomial: the commitment is X_i itself.
      const size_t degree = threshold_mode() ? *threshold_ - 1 : 0;
      polynomial_ = Polynomial::Random(degree);
      schnorr_commitment_ = SchnorrCommit();

      local_decommitment_.rid = Csprng::RandomBytes(kRidLen);
      local_decommitment_.commitments = polynomial_.Commit();
      local_decommitment_.schnorr_commit = schnorr_commitment_.a;
      if (hd_enabled_) {
        local_decommitment_.chain_code = Csprng::RandomBytes(kChainCodeLen);
      }
      CommitmentResult committed =
          CommitMessage(kDecommitDomain, DecommitmentMessage(self_id(), local_decommitment_), kNonceLen);
      local_decommitment_.nonce = std::move(committed.randomness);

      Bytes commitment = std::move(committed.commitment);
      commitments_[self_id()] = commitment;
      out.push_back(MakeBroadcast(MessageType(KeygenMessageType::kCommit), std::move(commitment)));
      return out;
    }
    case Stage::kEcho:
      out.push_back(MakeBroadcast(MessageType(KeygenMessageType::kEcho),
                                  EchoDigest(session_id(), participants(), commitments_)));
      return out;
    case Stage::kDecommit: {
      Bytes payload = EncodeDecommitmentBody(local_decommitment_);
      payload.insert(payload.end(), local_decommitment_.nonce.begin(), local_decommitment_.nonce.end());
      decommitments_[self_id()] = local_decommitment_;
      out.push_back(MakeBroadcast(MessageType(KeygenMessageType::kDecommit), std::move(payload)));

      if (threshold_mode()) {
        for (PartyIndex peer : peers()) {
          out.push_back(MakeDirect(peer, MessageType(KeygenMessageType::kShare),
                                   EncodeScalarPayload(polynomial_.EvaluateAt(peer))));
        }
        shares_[self_id()] = polynomial_.EvaluateAt(self_id());
      }
      return out;
    }
    case Stage::kSchnorr: {
      const Scalar z = SchnorrRespond(SchnorrContext(self_id(), round),
                                      local_decommitment_.commitments.front(),
                                      schnorr_commitment_,
                                      polynomial_.coefficients.front());
      SecureZeroize(&schnorr_commitment_.alpha);
      out.push_back(MakeBroadcast(MessageType(KeygenMessageType::kSchnorr), EncodeScalarPayload(z)));
      return out;
    }
  }
  return out;
}

void KeygenSession::ValidateMessage(uint32_t round, const Envelope& envelope) {
  switch (StageOf(round)) {
    case Stage::kCommit: {
      if (envelope.payload.size() != kCommitmentLen) {
        throw std::invalid_argument("keygen commitment must be 32 bytes");
      }
      commitments_[envelope.from] = envelope.payload;
      return;
    }
    case Stage::kEcho: {
      const Bytes expected = EchoDigest(session_id(), participants(), commitments_);
      if (envelope.payload != expected) {
        throw ProtocolAbort(AbortReason::kRound1NotReliable,
                            {envelope.from},
                            "echo of the round 1 commitments does not match");
      }
      return;
    }
    case Stage::kDecommit:
      if (envelope.type == MessageType(KeygenMessageType::kDecommit)) {
        HandleDecommit(envelope);
      } else {
        HandleShare(envelope);
      }
      return;
    case Stage::kSchnorr:
      HandleSchnorr(envelope);
      return;
  }
}

void KeygenSession::FinishRound(uint32_t round) {
  switch (StageOf(round)) {
    case Stage::kCommit:
    case Stage::kEcho:
      return;
    case Stage::kDecommit:
      rid_.assign(kRidLen, 0);
      for (PartyIndex id : participants()) {
        XorInto(decommitments_.at(id).rid, &rid_);
      }
      return;
    case Stage::kSchnorr:
      BuildResult();
      return;
  }
}

Bytes KeygenSession::EncodeDecommitmentBody(const Decommitment& decommitment) const {
  Bytes out;
  out.insert(out.end(), decommitment.rid.begin(), decommitment.rid.end());
  AppendU32Be(static_cast<uint32_t>(decommitment.commitments.size()), &out);
  for (const ECPoint& point : decommitment.commitments) {
    AppendPoint(point, &out);
  }
  AppendPoint(decommitment.schnorr_commit, &out);
  out.push_back(decommitment.chain_code.has_value() ? 1 : 0);
  if (decommitment.chain_code.has_value()) {
    out.insert(out.end(), decommitment.chain_code->begin(), decommitment.chain_code->end());
  }
  return out;
}

KeygenSession::Decommitment KeygenSession::DecodeDecommitment(std::span<const uint8_t> payload) const {
  Decommitment out;
  size_t offset = 0;
  out.rid = ReadFixedField(payload, &offset, kRidLen, "rid");

  const uint32_t count = ReadU32Be(payload, &offset);
  if (count > participants().size()) {
    throw std::invalid_argument("keygen decommitment carries too many commitments");
  }
  out.commitments.reserve(count);
  for (uint32_t k = 0; k < count; ++k) {
    out.commitments.push_back(ReadPoint(payload, &offset));
  }
  out.schnorr_commit = ReadPoint(payload, &offset);

  const Bytes chain_flag = ReadFixedField(payload, &offset, 1, "chain code flag");
  if (chain_flag[0] > 1) {
    throw std::invalid_argument("chain code flag must be 0 or 1");
  }
  if (chain_flag[0] == 1) {
    out.chain_code = ReadFixedField(payload, &offset, kChainCodeLen, "chain code");
  }
  out.nonce = ReadFixedField(payload, &offset, kNonceLen, "decommitment nonce");
  EnsureFullyConsumed(payload, offset, "keygen decommitment");
  return out;
}

Bytes KeygenSession::DecommitmentMessage(PartyIndex party, const Decommitment& decommitment) const {
  Bytes message;
  AppendSizedField(session_id(), &message);
  AppendU32Be(party, &message);
  const Bytes body = EncodeDecommitmentBody(decommitment);
  message.insert(message.end(), body.begin(), body.end());
  return message;
}

void KeygenSession::HandleDecommit(const Envelope& envelope) {
  Decommitment decommitment = DecodeDecommitment(envelope.payload);
  if (!VerifyCommitment(kDecommitDomain, DecommitmentMessage(envelope.from, decommitment), decommitment.nonce,
                        commitments_.at(envelope.from))) {
    throw ProtocolAbort(AbortReason::kInvalidDecommitment, {envelope.from},
                        "decommitment does not open the round 1 commitment");
  }

  const size_t expected = threshold_mode() ? *threshold_ : 1;
  if (decommitment.commitments.size() != expected) {
    throw ProtocolAbort(AbortReason::kInvalidFeldmanCommitmentSize, {envelope.from},
                        str(boost::format("expected %1% Feldman commitments, got %2%") % expected %
                            decommitment.commitments.size()));
  }
  if (decommitment.commitments.front().IsInfinity()) {
    throw ProtocolAbort(AbortReason::kInvalidDecommitment, {envelope.from},
                        "public contribution is the point at infinity");
  }
  if (hd_enabled_ && !decommitment.chain_code.has_value()) {
    throw ProtocolAbort(AbortReason::kMissingChainCode, {envelope.from},
                        "HD keygen requires a chain code contribution");
  }

  decommitments_[envelope.from] = std::move(decommitment);
  if (shares_.contains(envelope.from)) {
    CheckShare(envelope.from);
  }
}

void KeygenSession::HandleShare(const Envelope& envelope) {
  shares_[envelope.from] = DecodeScalarPayload(envelope.payload, "keygen share");
  if (decommitments_.contains(envelope.from)) {
    CheckShare(envelope.from);
  }
}

void KeygenSession::CheckShare(PartyIndex dealer) const {
  const std::vector<ECPoint>& commitments = decommitments_.at(dealer).commitments;
  if (!VerifyFeldmanShare(commitments, self_id(), shares_.at(dealer))) {
    throw ProtocolAbort(AbortReason::kInvalidSecretShare, {dealer},
                        "secret share does not match the dealer's Feldman commitments");
  }
}

ProofContext KeygenSession::SchnorrContext(PartyIndex prover, uint32_t round) const {
  return ProofContext{
      .session_id = session_id(),
      .prover = prover,
      .verifier = 0,
      .round = round,
      .tag = rid_,
  };
}

void KeygenSession::HandleSchnorr(const Envelope& envelope) {
  const Scalar z = DecodeScalarPayload(envelope.payload, "keygen schnorr response");
  const Decommitment& decommitment = decommitments_.at(envelope.from);
  const ProofCheck check = VerifySchnorrResponse(SchnorrContext(envelope.from, current_round()),
                                                 decommitment.commitments.front(),
                                                 decommitment.schnorr_commit,
                                                 z);
  if (check != ProofCheck::kOk) {
    throw ProtocolAbort(AbortReason::kInvalidSchnorrProof, {envelope.from},
                        std::string("schnorr proof rejected: ") + ProofCheckName(check));
  }
}

void KeygenSession::BuildResult() {
  CoreKeyShare share;
  share.i = self_id();
  share.key_info.curve = CurveId::kSecp256k1;
  share.key_info.participants = participants();

  std::vector<ECPoint> constant_terms;
  for (PartyIndex id : participants()) {
    constant_terms.push_back(decommitments_.at(id).commitments.front());
  }
  share.key_info.shared_public_key = SumPoints(constant_terms);

  if (threshold_mode()) {
    Scalar x;
    for (PartyIndex id : participants()) {
      x = x + shares_.at(id);
    }
    share.x = x;
    for (PartyIndex k : participants()) {
      std::vector<ECPoint> evaluations;
      for (PartyIndex dealer : participants()) {
        evaluations.push_back(EvaluateCommitmentAt(decommitments_.at(dealer).commitments, k));
      }
      share.key_info.public_shares[k] = SumPoints(evaluations);
    }
    share.key_info.vss_setup = VssSetup{.threshold = *threshold_};
  } else {
    share.x = polynomial_.coefficients.front();
    for (PartyIndex k : participants()) {
      share.key_info.public_shares[k] = decommitments_.at(k).commitments.front();
    }
  }

  if (hd_enabled_) {
    Bytes chain_code(kChainCodeLen, 0);
    for (PartyIndex id : participants()) {
      XorInto(*decommitments_.at(id).chain_code, &chain_code);
    }
    share.key_info.chain_code = std::move(chain_code);
  }

  try {
    share.Validate();
  } catch (const LocalValidationError& ex) {
    throw CryptoFailure(std::string("keygen produced an inconsistent key share: ") + ex.what());
  }

  polynomial_.Zeroize();
  SecureZeroize(&shares_);
  BOOST_LOG_TRIVIAL(debug) << str(boost::format("keygen party %1%: key share ready, %2% of %3%") %
                                  self_id() % share.key_info.min_signers() % participants().size());
  result_ = std::move(share);
}

}  // namespace cggmp
