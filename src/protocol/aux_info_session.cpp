#include "cggmp/protocol/aux_info_session.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include "cggmp/common/secure_zeroize.hpp"
#include "cggmp/common/thread_pool.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/bigint.hpp"
#include "cggmp/crypto/commitment.hpp"
#include "cggmp/crypto/random.hpp"
#include "cggmp/protocol/commit_reveal.hpp"

namespace cggmp {
namespace {

constexpr char kDecommitDomain[] = "CGGMP21/aux-info/decommit";
constexpr size_t kNonceLen = 32;

uint32_t MessageType(AuxInfoMessageType type) {
  return static_cast<uint32_t>(type);
}

ProtocolAbort Blame(AbortReason reason, PartyIndex culprit, const std::string& detail) {
  return ProtocolAbort(reason, {culprit}, detail);
}

}  // namespace

AuxInfoSession::AuxInfoSession(AuxInfoSessionConfig cfg)
    : RoundSession(std::move(cfg.session_id), cfg.self_id, std::move(cfg.participants), cfg.timeout),
      level_(std::move(cfg.level)),
      refresh_shares_(cfg.refresh_shares),
      key_share_(std::move(cfg.key_share)),
      enforce_reliable_broadcast_(cfg.enforce_reliable_broadcast),
      paillier_(std::move(cfg.paillier)) {
  level_.Validate();

  if (refresh_shares_) {
    if (!key_share_.has_value()) {
      throw LocalValidationError("refresh requires the current key share");
    }
    if (key_share_->i != self_id()) {
      throw LocalValidationError("key share belongs to another party");
    }
    key_share_->Validate();

    const std::vector<PartyIndex>& holders = key_share_->key_info.participants;
    const std::unordered_set<PartyIndex> holder_set(holders.begin(), holders.end());
    if (holders.size() != participants().size()) {
      throw LocalValidationError("refresh must run among every holder of the key");
    }
    for (PartyIndex id : participants()) {
      if (!holder_set.contains(id)) {
        throw LocalValidationError("party " + std::to_string(id) + " does not hold the key");
      }
    }
  }

  if (paillier_ != nullptr && BitLength(paillier_->modulus_n()) < level_.paillier_bits) {
    throw LocalValidationError("pre-generated Paillier modulus is below the security level");
  }
}

AuxInfoSession::~AuxInfoSession() {
  zero_polynomial_.Zeroize();
  SecureZeroize(&zero_shares_);
  SecureZeroize(&pedersen_witness_.lambda);
  SecureZeroize(&pedersen_witness_.phi);
}

bool AuxInfoSession::refresh_shares() const {
  return refresh_shares_;
}

bool AuxInfoSession::HasResult() const {
  return result_.has_value();
}

const AuxInfoResult& AuxInfoSession::result() const {
  if (!result_.has_value()) {
    throw std::logic_error("aux info result is not ready");
  }
  return *result_;
}

uint32_t AuxInfoSession::round_count() const {
  return enforce_reliable_broadcast_ ? 4 : 3;
}

const char* AuxInfoSession::protocol_name() const {
  return refresh_shares_ ? "key-refresh" : "aux-info";
}

AuxInfoSession::Stage AuxInfoSession::StageOf(uint32_t round) const {
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
      return Stage::kProofs;
    default:
      throw std::logic_error("aux info round out of range");
  }
}

uint32_t AuxInfoSession::decommit_round() const {
  return enforce_reliable_broadcast_ ? 3 : 2;
}

size_t AuxInfoSession::zero_sharing_degree() const {
  if (key_share_->key_info.vss_setup.has_value()) {
    return key_share_->key_info.vss_setup->threshold - 1;
  }
  return participants().size() - 1;
}

std::vector<RoundMessageSpec> AuxInfoSession::ExpectedMessages(uint32_t round) const {
  switch (StageOf(round)) {
    case Stage::kCommit:
      return {{MessageType(AuxInfoMessageType::kCommit), MessageScope::kBroadcast}};
    case Stage::kEcho:
      return {{MessageType(AuxInfoMessageType::kEcho), MessageScope::kBroadcast}};
    case Stage::kDecommit:
      return {{MessageType(AuxInfoMessageType::kDecommit), MessageScope::kBroadcast}};
    case Stage::kProofs:
      return {{MessageType(AuxInfoMessageType::kProofs), MessageScope::kDirect}};
  }
  return {};
}

ProofContext AuxInfoSession::Context(PartyIndex prover,
                                     PartyIndex verifier,
                                     uint32_t round,
                                     bool bind_rid) const {
  return ProofContext{
      .session_id = session_id(),
      .prover = prover,
      .verifier = verifier,
      .round = round,
      .tag = bind_rid ? rid_ : Bytes{},
  };
}

std::vector<Envelope> AuxInfoSession::BeginRound(uint32_t round) {
  std::vector<Envelope> out;
  switch (StageOf(round)) {
    case Stage::kCommit: {
      if (paillier_ == nullptr) {
        paillier_ = std::make_shared<const PaillierProvider>(level_.paillier_bits);
        BOOST_LOG_TRIVIAL(debug) << str(boost::format("%1% party %2%: generated %3%-bit Paillier modulus") %
                                        protocol_name() % self_id() % BitLength(paillier_->modulus_n()));
      }

      RingPedersenSetup setup = GenerateRingPedersen(*paillier_);
      pedersen_witness_ = std::move(setup.witness);
      local_decommitment_.pedersen = setup.params;
      local_decommitment_.prm_proof = ProveRingPedersenParams(
          Context(self_id(), 0, decommit_round(), false), setup.params, pedersen_witness_, level_.m);
      local_decommitment_.rid = Csprng::RandomBytes(kRidLen);
      if (refresh_shares_) {
        zero_polynomial_ = Polynomial::RandomWithConstant(Scalar(), zero_sharing_degree());
        local_decommitment_.zero_commitments = zero_polynomial_.Commit();
      }
      CommitmentResult committed =
          CommitMessage(kDecommitDomain, DecommitmentMessage(self_id(), local_decommitment_), kNonceLen);
      local_decommitment_.nonce = std::move(committed.randomness);

      Bytes commitment = std::move(committed.commitment);
      commitments_[self_id()] = commitment;
      out.push_back(MakeBroadcast(MessageType(AuxInfoMessageType::kCommit), std::move(commitment)));
      return out;
    }
    case Stage::kEcho:
      out.push_back(MakeBroadcast(MessageType(AuxInfoMessageType::kEcho),
                                  EchoDigest(session_id(), participants(), commitments_)));
      return out;
    case Stage::kDecommit: {
      Bytes payload = EncodeDecommitmentBody(local_decommitment_);
      payload.insert(payload.end(), local_decommitment_.nonce.begin(), local_decommitment_.nonce.end());
      decommitments_[self_id()] = local_decommitment_;
      out.push_back(MakeBroadcast(MessageType(AuxInfoMessageType::kDecommit), std::move(payload)));
      return out;
    }
    case Stage::kProofs: {
      const mpz_class n = paillier_->modulus_n();
      const mpz_class p = paillier_->prime_p();
      const mpz_class q = paillier_->prime_q();
      const PaillierModProof mod_proof =
          ProvePaillierMod(Context(self_id(), 0, round, true), n, p, q, level_.m);

      std::vector<Bytes> payloads = ProofThreadPool().Map(peers(), [&](const PartyIndex& peer) {
        const RingPedersenParams& peer_params = decommitments_.at(peer).pedersen;
        PeerProofs proofs;
        proofs.mod_proof = mod_proof;
        proofs.fac_proof =
            ProveNoSmallFactor(Context(self_id(), peer, round, true), level_, n, p, q, peer_params);
        if (refresh_shares_) {
          Scalar share = zero_polynomial_.EvaluateAt(peer);
          ScopedZeroize<Scalar> wipe_share(&share);
          const PaillierPublicKey peer_key{.n = peer_params.n};
          proofs.encrypted_share = peer_key.EncryptWithRandom(share.value()).ciphertext;
        }
        return EncodePeerProofs(proofs);
      });

      for (size_t k = 0; k < peers().size(); ++k) {
        out.push_back(MakeDirect(peers()[k], MessageType(AuxInfoMessageType::kProofs), std::move(payloads[k])));
      }
      if (refresh_shares_) {
        zero_shares_[self_id()] = zero_polynomial_.EvaluateAt(self_id());
      }
      return out;
    }
  }
  return out;
}

void AuxInfoSession::ValidateMessage(uint32_t round, const Envelope& envelope) {
  switch (StageOf(round)) {
    case Stage::kCommit:
      if (envelope.payload.size() != kCommitmentLen) {
        throw std::invalid_argument("aux info commitment must be 32 bytes");
      }
      commitments_[envelope.from] = envelope.payload;
      return;
    case Stage::kEcho:
      if (envelope.payload != EchoDigest(session_id(), participants(), commitments_)) {
        throw Blame(AbortReason::kRound1NotReliable, envelope.from,
                    "echo of the round 1 commitments does not match");
      }
      return;
    case Stage::kDecommit:
      HandleDecommit(envelope);
      return;
    case Stage::kProofs:
      HandleProofs(envelope);
      return;
  }
}

void AuxInfoSession::FinishRound(uint32_t round) {
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
    case Stage::kProofs:
      BuildResult();
      return;
  }
}

Bytes AuxInfoSession::EncodeDecommitmentBody(const Decommitment& decommitment) const {
  Bytes out;
  AppendMpzField(decommitment.pedersen.n, &out);
  AppendMpzField(decommitment.pedersen.s, &out);
  AppendMpzField(decommitment.pedersen.t, &out);
  AppendRingPedersenParamProof(decommitment.prm_proof, &out);
  out.insert(out.end(), decommitment.rid.begin(), decommitment.rid.end());
  AppendU32Be(static_cast<uint32_t>(decommitment.zero_commitments.size()), &out);
  for (const ECPoint& point : decommitment.zero_commitments) {
    AppendPoint(point, &out);
  }
  return out;
}

AuxInfoSession::Decommitment AuxInfoSession::DecodeDecommitment(std::span<const uint8_t> payload) const {
  Decommitment out;
  size_t offset = 0;
  out.pedersen.n = ReadMpzField(payload, &offset, kMaxMpzFieldLen, "N");
  out.pedersen.s = ReadMpzField(payload, &offset, kMaxMpzFieldLen, "s");
  out.pedersen.t = ReadMpzField(payload, &offset, kMaxMpzFieldLen, "t");
  out.prm_proof = ReadRingPedersenParamProof(payload, &offset);
  out.rid = ReadFixedField(payload, &offset, kRidLen, "rid");

  const uint32_t count = ReadU32Be(payload, &offset);
  if (count > participants().size()) {
    throw std::invalid_argument("aux info decommitment carries too many commitments");
  }
  out.zero_commitments.reserve(count);
  for (uint32_t k = 0; k < count; ++k) {
    out.zero_commitments.push_back(ReadPoint(payload, &offset));
  }
  out.nonce = ReadFixedField(payload, &offset, kNonceLen, "decommitment nonce");
  EnsureFullyConsumed(payload, offset, "aux info decommitment");
  return out;
}

Bytes AuxInfoSession::DecommitmentMessage(PartyIndex party, const Decommitment& decommitment) const {
  Bytes message;
  AppendSizedField(session_id(), &message);
  AppendU32Be(party, &message);
  const Bytes body = EncodeDecommitmentBody(decommitment);
  message.insert(message.end(), body.begin(), body.end());
  return message;
}

Bytes AuxInfoSession::EncodePeerProofs(const PeerProofs& proofs) const {
  Bytes out;
  AppendPaillierModProof(proofs.mod_proof, &out);
  AppendNoSmallFactorProof(proofs.fac_proof, &out);
  out.push_back(proofs.encrypted_share.has_value() ? 1 : 0);
  if (proofs.encrypted_share.has_value()) {
    AppendMpzField(*proofs.encrypted_share, &out);
  }
  return out;
}

AuxInfoSession::PeerProofs AuxInfoSession::DecodePeerProofs(std::span<const uint8_t> payload) const {
  PeerProofs out;
  size_t offset = 0;
  out.mod_proof = ReadPaillierModProof(payload, &offset);
  out.fac_proof = ReadNoSmallFactorProof(payload, &offset);
  const Bytes flag = ReadFixedField(payload, &offset, 1, "share flag");
  if (flag[0] > 1) {
    throw std::invalid_argument("share flag must be 0 or 1");
  }
  if (flag[0] == 1) {
    out.encrypted_share = ReadMpzField(payload, &offset, kMaxMpzFieldLen, "encrypted share");
  }
  EnsureFullyConsumed(payload, offset, "aux info proofs");
  return out;
}

void AuxInfoSession::HandleDecommit(const Envelope& envelope) {
  Decommitment decommitment = DecodeDecommitment(envelope.payload);
  if (!VerifyCommitment(kDecommitDomain, DecommitmentMessage(envelope.from, decommitment), decommitment.nonce,
                        commitments_.at(envelope.from))) {
    throw Blame(AbortReason::kInvalidDecommitment, envelope.from,
                "decommitment does not open the round 1 commitment");
  }

  const mpz_class& n = decommitment.pedersen.n;
  if (BitLength(n) < level_.paillier_bits || mpz_even_p(n.get_mpz_t()) != 0) {
    throw Blame(AbortReason::kInvalidPaillierModulus, envelope.from,
                str(boost::format("Paillier modulus of %1% bits is below the required %2%") % BitLength(n) %
                    level_.paillier_bits));
  }
  for (const auto& [id, other] : decommitments_) {
    if (other.pedersen.n == n) {
      throw Blame(AbortReason::kInvalidPaillierModulus, envelope.from,
                  "Paillier modulus duplicates the one of party " + std::to_string(id));
    }
  }

  if (!decommitment.pedersen.IsWellFormed()) {
    throw Blame(AbortReason::kInvalidPrmProof, envelope.from, "ring-Pedersen parameters are malformed");
  }
  const ProofCheck prm_check = VerifyRingPedersenParams(
      Context(envelope.from, 0, decommit_round(), false), decommitment.pedersen, decommitment.prm_proof, level_.m);
  if (prm_check != ProofCheck::kOk) {
    throw Blame(AbortReason::kInvalidPrmProof, envelope.from,
                std::string("ring-Pedersen proof rejected: ") + ProofCheckName(prm_check));
  }

  const size_t expected = refresh_shares_ ? zero_sharing_degree() + 1 : 0;
  if (decommitment.zero_commitments.size() != expected) {
    throw Blame(AbortReason::kInvalidFeldmanCommitmentSize, envelope.from,
                str(boost::format("expected %1% zero-sharing commitments, got %2%") % expected %
                    decommitment.zero_commitments.size()));
  }
  if (refresh_shares_ && !decommitment.zero_commitments.front().IsInfinity()) {
    throw Blame(AbortReason::kInvalidDecommitment, envelope.from,
                "refresh polynomial does not share zero");
  }

  decommitments_[envelope.from] = std::move(decommitment);
}

void AuxInfoSession::HandleProofs(const Envelope& envelope) {
  const PeerProofs proofs = DecodePeerProofs(envelope.payload);
  const Decommitment& theirs = decommitments_.at(envelope.from);
  const mpz_class& n = theirs.pedersen.n;

  const ProofCheck mod_check =
      VerifyPaillierMod(Context(envelope.from, 0, current_round(), true), n, proofs.mod_proof, level_.m);
  if (mod_check != ProofCheck::kOk) {
    throw Blame(AbortReason::kInvalidModProof, envelope.from,
                std::string("Paillier-Blum proof rejected: ") + ProofCheckName(mod_check));
  }

  const ProofCheck fac_check = VerifyNoSmallFactor(Context(envelope.from, self_id(), current_round(), true),
                                                   level_, n, local_decommitment_.pedersen, proofs.fac_proof);
  if (fac_check != ProofCheck::kOk) {
    throw Blame(AbortReason::kInvalidFacProof, envelope.from,
                std::string("no-small-factor proof rejected: ") + ProofCheckName(fac_check));
  }

  if (refresh_shares_ != proofs.encrypted_share.has_value()) {
    throw std::invalid_argument("encrypted share presence does not match the session mode");
  }
  if (!refresh_shares_) {
    return;
  }

  const mpz_class& ciphertext = *proofs.encrypted_share;
  if (!paillier_->public_key().IsValidCiphertext(ciphertext)) {
    throw Blame(AbortReason::kInvalidSecretShare, envelope.from, "encrypted refresh share is not a ciphertext");
  }
  mpz_class plaintext = paillier_->Decrypt(ciphertext);
  ScopedZeroize<mpz_class> wipe_plaintext(&plaintext);
  if (plaintext >= Scalar::ModulusQ()) {
    throw Blame(AbortReason::kInvalidSecretShare, envelope.from, "refresh share is out of range");
  }
  const Scalar share(plaintext);
  if (!VerifyFeldmanShare(theirs.zero_commitments, self_id(), share)) {
    throw Blame(AbortReason::kInvalidSecretShare, envelope.from,
                "refresh share does not match the zero-sharing commitments");
  }
  zero_shares_[envelope.from] = share;
}

void AuxInfoSession::BuildResult() {
  AuxInfoResult out;
  out.aux_info.i = self_id();
  out.aux_info.paillier = paillier_;
  for (PartyIndex id : participants()) {
    const RingPedersenParams& params = decommitments_.at(id).pedersen;
    out.aux_info.parties[id] = PartyAuxInfo{
        .paillier = PaillierPublicKey{.n = params.n},
        .pedersen = params,
    };
  }
  out.aux_info.Validate(participants());

  if (refresh_shares_) {
    CoreKeyShare share = *key_share_;
    const bool threshold = share.key_info.vss_setup.has_value();
    // Additive shares hold Z(k) weighted by the full-set Lagrange coefficient,
    // so the weighted zero shares still sum to zero.
    const auto weight = [&](PartyIndex k) {
      return threshold ? Scalar::FromUint64(1) : LagrangeCoefficientAtZero(participants(), k);
    };

    Scalar delta;
    for (PartyIndex id : participants()) {
      delta = delta + zero_shares_.at(id);
    }
    share.x = share.x + weight(self_id()) * delta;
    delta.Zeroize();

    for (PartyIndex k : participants()) {
      std::vector<ECPoint> evaluations;
      for (PartyIndex dealer : participants()) {
        evaluations.push_back(EvaluateCommitmentAt(decommitments_.at(dealer).zero_commitments, k));
      }
      ECPoint& public_share = share.key_info.public_shares.at(k);
      public_share = public_share.Add(SumPoints(evaluations).Mul(weight(k)));
    }

    try {
      share.Validate();
    } catch (const LocalValidationError& ex) {
      throw CryptoFailure(std::string("refresh changed the public key: ") + ex.what());
    }
    if (share.key_info.shared_public_key != key_share_->key_info.shared_public_key) {
      throw CryptoFailure("refresh changed the public key");
    }
    out.refreshed_share = std::move(share);
  }

  zero_polynomial_.Zeroize();
  SecureZeroize(&zero_shares_);
  result_ = std::move(out);
}

}  // namespace cggmp
