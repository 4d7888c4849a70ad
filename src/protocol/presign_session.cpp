#include "cggmp/protocol/presign_session.hpp"

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
#include "cggmp/crypto/feldman.hpp"
#include "cggmp/crypto/random.hpp"

namespace cggmp {
namespace {

uint32_t MessageType(PresignMessageType type) {
  return static_cast<uint32_t>(type);
}

ProtocolAbort Blame(AbortReason reason, PartyIndex culprit, const std::string& detail) {
  return ProtocolAbort(reason, {culprit}, detail);
}

}  // namespace

Presignature::Presignature(PartyIndex owner,
                           ECPoint r_point,
                           Scalar k,
                           Scalar chi,
                           std::vector<PartyIndex> signers,
                           Bytes key_hash)
    : owner_(owner),
      r_point_(r_point),
      secrets_(PresignatureSecrets{.k = std::move(k), .chi = std::move(chi)}),
      signers_(std::move(signers)),
      key_hash_(std::move(key_hash)) {}

Presignature::~Presignature() {
  if (secrets_.has_value()) {
    secrets_->k.Zeroize();
    secrets_->chi.Zeroize();
  }
}

Presignature::Presignature(Presignature&& other) noexcept
    : owner_(other.owner_),
      r_point_(other.r_point_),
      secrets_(std::move(other.secrets_)),
      signers_(std::move(other.signers_)),
      key_hash_(std::move(other.key_hash_)) {
  other.secrets_.reset();
}

Presignature& Presignature::operator=(Presignature&& other) noexcept {
  if (this != &other) {
    if (secrets_.has_value()) {
      secrets_->k.Zeroize();
      secrets_->chi.Zeroize();
    }
    owner_ = other.owner_;
    r_point_ = other.r_point_;
    secrets_ = std::move(other.secrets_);
    signers_ = std::move(other.signers_);
    key_hash_ = std::move(other.key_hash_);
    other.secrets_.reset();
  }
  return *this;
}

PartyIndex Presignature::owner() const {
  return owner_;
}

const ECPoint& Presignature::r_point() const {
  return r_point_;
}

const std::vector<PartyIndex>& Presignature::signers() const {
  return signers_;
}

const Bytes& Presignature::key_hash() const {
  return key_hash_;
}

bool Presignature::consumed() const {
  return !secrets_.has_value();
}

PresignatureSecrets Presignature::Consume() {
  if (!secrets_.has_value()) {
    throw LocalValidationError("presignature was already used");
  }
  PresignatureSecrets out = std::move(*secrets_);
  secrets_.reset();
  return out;
}

PresignSession::PresignSession(PresignSessionConfig cfg)
    : RoundSession(std::move(cfg.session_id), cfg.self_id, std::move(cfg.signers), cfg.timeout),
      level_(std::move(cfg.level)),
      key_share_(std::move(cfg.key_share)) {
  level_.Validate();
  if (key_share_.core.i != self_id()) {
    throw LocalValidationError("key share belongs to another party");
  }
  key_share_.Validate();

  const KeyInfo& info = key_share_.core.key_info;
  const std::unordered_set<PartyIndex> holders(info.participants.begin(), info.participants.end());
  for (PartyIndex signer : participants()) {
    if (!holders.contains(signer)) {
      throw LocalValidationError("signer " + std::to_string(signer) + " does not hold the key");
    }
  }
  if (participants().size() < info.min_signers()) {
    throw LocalValidationError(str(boost::format("%1% signers cannot meet the threshold of %2%") %
                                   participants().size() % info.min_signers()));
  }

  weighted_x_ = info.vss_setup.has_value()
                    ? LagrangeCoefficientAtZero(participants(), self_id()) * key_share_.core.x
                    : key_share_.core.x;
  key_hash_ = HashKeyInfo(info);
}

PresignSession::~PresignSession() {
  weighted_x_.Zeroize();
  k_.Zeroize();
  gamma_.Zeroize();
  delta_.Zeroize();
  chi_.Zeroize();
  SecureZeroize(&k_rho_);
  SecureZeroize(&gamma_nu_);
  SecureZeroize(&betas_);
  SecureZeroize(&beta_hats_);
  SecureZeroize(&alphas_);
  SecureZeroize(&alpha_hats_);
}

bool PresignSession::HasResult() const {
  return result_.has_value();
}

Presignature PresignSession::TakeResult() {
  if (!result_.has_value()) {
    throw std::logic_error("presignature is not available");
  }
  Presignature out = std::move(*result_);
  result_.reset();
  return out;
}

uint32_t PresignSession::round_count() const {
  return 3;
}

const char* PresignSession::protocol_name() const {
  return "presign";
}

std::vector<RoundMessageSpec> PresignSession::ExpectedMessages(uint32_t round) const {
  switch (round) {
    case 1:
      return {{MessageType(PresignMessageType::kCiphertexts), MessageScope::kBroadcast},
              {MessageType(PresignMessageType::kEncProof), MessageScope::kDirect}};
    case 2:
      return {{MessageType(PresignMessageType::kMta), MessageScope::kDirect}};
    case 3:
      return {{MessageType(PresignMessageType::kDelta), MessageScope::kBroadcast},
              {MessageType(PresignMessageType::kDeltaProof), MessageScope::kDirect}};
    default:
      throw std::logic_error("presign round out of range");
  }
}

ProofContext PresignSession::Context(PartyIndex prover,
                                     PartyIndex verifier,
                                     uint32_t round,
                                     std::string_view label) const {
  const std::span<const uint8_t> tag = AsByteSpan(label);
  return ProofContext{
      .session_id = session_id(),
      .prover = prover,
      .verifier = verifier,
      .round = round,
      .tag = Bytes(tag.begin(), tag.end()),
  };
}

const PartyAuxInfo& PresignSession::AuxOf(PartyIndex party) const {
  return key_share_.aux.parties.at(party);
}

PaillierPublicKey PresignSession::OwnKey() const {
  return key_share_.aux.paillier->public_key();
}

std::vector<Envelope> PresignSession::BeginRound(uint32_t round) {
  switch (round) {
    case 1:
      return BuildRound1();
    case 2:
      return BuildRound2();
    case 3:
      return BuildRound3();
    default:
      throw std::logic_error("presign round out of range");
  }
}

void PresignSession::ValidateMessage(uint32_t round, const Envelope& envelope) {
  const auto type = static_cast<PresignMessageType>(envelope.type);
  switch (type) {
    case PresignMessageType::kCiphertexts:
      HandleCiphertexts(envelope);
      return;
    case PresignMessageType::kEncProof:
      HandleEncProof(envelope);
      return;
    case PresignMessageType::kMta:
      HandleMta(envelope);
      return;
    case PresignMessageType::kDelta:
      HandleDelta(envelope);
      return;
    case PresignMessageType::kDeltaProof:
      HandleDeltaProof(envelope);
      return;
  }
  throw std::logic_error("presign message type not expected in round " + std::to_string(round));
}

void PresignSession::FinishRound(uint32_t round) {
  if (round == 3) {
    BuildResult();
  }
}

std::vector<Envelope> PresignSession::BuildRound1() {
  const PaillierPublicKey own = OwnKey();
  k_ = Csprng::RandomNonZeroScalar();
  gamma_ = Csprng::RandomNonZeroScalar();

  PaillierCiphertextWithRandom k_enc = own.EncryptWithRandom(k_.value());
  PaillierCiphertextWithRandom g_enc = own.EncryptWithRandom(gamma_.value());
  k_ciphertext_ = k_enc.ciphertext;
  k_rho_ = k_enc.randomness;
  g_ciphertext_ = g_enc.ciphertext;
  gamma_nu_ = g_enc.randomness;
  SecureZeroize(&k_enc.randomness);
  SecureZeroize(&g_enc.randomness);

  std::vector<Envelope> out;
  Bytes ciphertexts;
  AppendMpzField(k_ciphertext_, &ciphertexts);
  AppendMpzField(g_ciphertext_, &ciphertexts);
  out.push_back(MakeBroadcast(MessageType(PresignMessageType::kCiphertexts), std::move(ciphertexts)));

  const EncRangeStatement statement{.prover_key = own, .ciphertext = k_ciphertext_};
  const EncRangeWitness witness{.plaintext = k_.value(), .randomness = k_rho_};
  std::vector<Bytes> proofs = ProofThreadPool().Map(peers(), [&](const PartyIndex& peer) {
    Bytes payload;
    AppendEncRangeProof(ProveEncRange(Context(self_id(), peer, 1, "k"), level_, statement, witness,
                                      AuxOf(peer).pedersen),
                        &payload);
    return payload;
  });
  for (size_t idx = 0; idx < peers().size(); ++idx) {
    out.push_back(MakeDirect(peers()[idx], MessageType(PresignMessageType::kEncProof), std::move(proofs[idx])));
  }
  return out;
}

std::vector<Envelope> PresignSession::BuildRound2() {
  struct Outbound {
    Bytes payload;
    Scalar beta;
    Scalar beta_hat;
  };

  const PaillierPublicKey own = OwnKey();
  const KeyInfo& info = key_share_.core.key_info;
  big_gamma_ = ECPoint::GeneratorMultiply(gamma_);
  gammas_[self_id()] = big_gamma_;
  const ECPoint own_public_share = SignerPublicShare(info, participants(), self_id());

  std::vector<Outbound> produced = ProofThreadPool().Map(peers(), [&](const PartyIndex& peer) {
    const PartyAuxInfo& peer_aux = AuxOf(peer);
    const PaillierPublicKey& peer_key = peer_aux.paillier;
    const mpz_class& peer_k = ciphertexts_.at(peer).k;

    MtaMessage message;
    message.gamma = big_gamma_;

    // D = K_j^gamma * enc_j(y), F = enc_i(y); this party keeps beta = -y.
    mpz_class y = RandomSignedBits(level_.EllPrimeBits());
    mpz_class s = RandomZnStar(peer_key.n);
    mpz_class r = RandomZnStar(own.n);
    message.d = peer_key.Add(peer_key.Scale(peer_k, gamma_.value()), peer_key.Encrypt(y, s));
    message.f = own.Encrypt(y, r);
    message.aff_proof = ProveAffineGroup(
        Context(self_id(), peer, 2, "gamma"), level_,
        AffineGroupStatement{
            .receiver_key = peer_key, .prover_key = own, .c = peer_k, .d = message.d, .y = message.f,
            .x = big_gamma_},
        AffineGroupWitness{.x = gamma_.value(), .y = y, .rho = s, .rho_y = r}, peer_aux.pedersen);
    const Scalar beta(-y);

    mpz_class y_hat = RandomSignedBits(level_.EllPrimeBits());
    mpz_class s_hat = RandomZnStar(peer_key.n);
    mpz_class r_hat = RandomZnStar(own.n);
    message.d_hat = peer_key.Add(peer_key.Scale(peer_k, weighted_x_.value()), peer_key.Encrypt(y_hat, s_hat));
    message.f_hat = own.Encrypt(y_hat, r_hat);
    message.aff_hat_proof = ProveAffineGroup(
        Context(self_id(), peer, 2, "x"), level_,
        AffineGroupStatement{
            .receiver_key = peer_key, .prover_key = own, .c = peer_k, .d = message.d_hat,
            .y = message.f_hat, .x = own_public_share},
        AffineGroupWitness{.x = weighted_x_.value(), .y = y_hat, .rho = s_hat, .rho_y = r_hat},
        peer_aux.pedersen);
    const Scalar beta_hat(-y_hat);

    message.log_proof = ProveLogStar(
        Context(self_id(), peer, 2, "gamma-log"), level_,
        LogStarStatement{
            .prover_key = own, .ciphertext = g_ciphertext_, .x = big_gamma_, .base = ECPoint::Generator()},
        LogStarWitness{.x = gamma_.value(), .rho = gamma_nu_}, peer_aux.pedersen);

    SecureZeroize(&y);
    SecureZeroize(&y_hat);
    return Outbound{.payload = EncodeMta(message), .beta = beta, .beta_hat = beta_hat};
  });

  std::vector<Envelope> out;
  for (size_t idx = 0; idx < peers().size(); ++idx) {
    const PartyIndex peer = peers()[idx];
    betas_[peer] = produced[idx].beta;
    beta_hats_[peer] = produced[idx].beta_hat;
    produced[idx].beta.Zeroize();
    produced[idx].beta_hat.Zeroize();
    out.push_back(MakeDirect(peer, MessageType(PresignMessageType::kMta), std::move(produced[idx].payload)));
  }
  return out;
}

std::vector<Envelope> PresignSession::BuildRound3() {
  std::vector<ECPoint> gammas;
  for (PartyIndex id : participants()) {
    gammas.push_back(gammas_.at(id));
  }
  gamma_sum_ = SumPoints(gammas);
  if (gamma_sum_.IsInfinity()) {
    throw ProtocolAbort(AbortReason::kPresignDeltaMismatch, {}, "sum of Gamma_j is the point at infinity");
  }
  big_delta_ = gamma_sum_.Mul(k_);

  delta_ = k_ * gamma_;
  chi_ = k_ * weighted_x_;
  for (PartyIndex peer : peers()) {
    delta_ = delta_ + alphas_.at(peer) + betas_.at(peer);
    chi_ = chi_ + alpha_hats_.at(peer) + beta_hats_.at(peer);
  }
  deltas_[self_id()] = PeerDelta{.delta = delta_, .big_delta = big_delta_};

  std::vector<Envelope> out;
  Bytes broadcast;
  AppendScalar(delta_, &broadcast);
  AppendPoint(big_delta_, &broadcast);
  out.push_back(MakeBroadcast(MessageType(PresignMessageType::kDelta), std::move(broadcast)));

  const PaillierPublicKey own = OwnKey();
  const LogStarStatement statement{
      .prover_key = own, .ciphertext = k_ciphertext_, .x = big_delta_, .base = gamma_sum_};
  const LogStarWitness witness{.x = k_.value(), .rho = k_rho_};
  std::vector<Bytes> proofs = ProofThreadPool().Map(peers(), [&](const PartyIndex& peer) {
    Bytes payload;
    AppendLogStarProof(
        ProveLogStar(Context(self_id(), peer, 3, "delta"), level_, statement, witness, AuxOf(peer).pedersen),
        &payload);
    return payload;
  });
  for (size_t idx = 0; idx < peers().size(); ++idx) {
    out.push_back(MakeDirect(peers()[idx], MessageType(PresignMessageType::kDeltaProof), std::move(proofs[idx])));
  }
  return out;
}

Bytes PresignSession::EncodeMta(const MtaMessage& message) const {
  Bytes out;
  AppendPoint(message.gamma, &out);
  AppendMpzField(message.d, &out);
  AppendMpzField(message.f, &out);
  AppendMpzField(message.d_hat, &out);
  AppendMpzField(message.f_hat, &out);
  AppendAffineGroupProof(message.aff_proof, &out);
  AppendAffineGroupProof(message.aff_hat_proof, &out);
  AppendLogStarProof(message.log_proof, &out);
  return out;
}

PresignSession::MtaMessage PresignSession::DecodeMta(std::span<const uint8_t> payload) const {
  MtaMessage out;
  size_t offset = 0;
  out.gamma = ReadPoint(payload, &offset);
  out.d = ReadMpzField(payload, &offset, kMaxMpzFieldLen, "D");
  out.f = ReadMpzField(payload, &offset, kMaxMpzFieldLen, "F");
  out.d_hat = ReadMpzField(payload, &offset, kMaxMpzFieldLen, "D_hat");
  out.f_hat = ReadMpzField(payload, &offset, kMaxMpzFieldLen, "F_hat");
  out.aff_proof = ReadAffineGroupProof(payload, &offset);
  out.aff_hat_proof = ReadAffineGroupProof(payload, &offset);
  out.log_proof = ReadLogStarProof(payload, &offset);
  EnsureFullyConsumed(payload, offset, "presign MtA message");
  return out;
}

void PresignSession::HandleCiphertexts(const Envelope& envelope) {
  size_t offset = 0;
  PeerCiphertexts ciphertexts;
  ciphertexts.k = ReadMpzField(envelope.payload, &offset, kMaxMpzFieldLen, "K");
  ciphertexts.g = ReadMpzField(envelope.payload, &offset, kMaxMpzFieldLen, "G");
  EnsureFullyConsumed(envelope.payload, offset, "presign ciphertexts");

  const PaillierPublicKey& key = AuxOf(envelope.from).paillier;
  if (!key.IsValidCiphertext(ciphertexts.k) || !key.IsValidCiphertext(ciphertexts.g)) {
    throw std::invalid_argument("presign ciphertext is not in Z*_{N^2}");
  }
  ciphertexts_[envelope.from] = std::move(ciphertexts);
  if (pending_enc_proofs_.contains(envelope.from)) {
    CheckEncProof(envelope.from);
  }
}

void PresignSession::HandleEncProof(const Envelope& envelope) {
  size_t offset = 0;
  EncRangeProof proof = ReadEncRangeProof(envelope.payload, &offset);
  EnsureFullyConsumed(envelope.payload, offset, "enc proof");
  pending_enc_proofs_[envelope.from] = std::move(proof);
  if (ciphertexts_.contains(envelope.from)) {
    CheckEncProof(envelope.from);
  }
}

void PresignSession::CheckEncProof(PartyIndex prover) {
  const EncRangeStatement statement{
      .prover_key = AuxOf(prover).paillier,
      .ciphertext = ciphertexts_.at(prover).k,
  };
  const ProofCheck check = VerifyEncRange(Context(prover, self_id(), 1, "k"), level_, statement,
                                          AuxOf(self_id()).pedersen, pending_enc_proofs_.at(prover));
  if (check != ProofCheck::kOk) {
    throw Blame(AbortReason::kInvalidEncProof, prover,
                std::string("encryption range proof rejected: ") + ProofCheckName(check));
  }
  pending_enc_proofs_.erase(prover);
}

void PresignSession::HandleMta(const Envelope& envelope) {
  const PartyIndex from = envelope.from;
  const MtaMessage message = DecodeMta(envelope.payload);
  const PaillierPublicKey own = OwnKey();
  const PaillierPublicKey& peer_key = AuxOf(from).paillier;
  const RingPedersenParams& own_params = AuxOf(self_id()).pedersen;

  if (message.gamma.IsInfinity()) {
    throw Blame(AbortReason::kInvalidLogStarProof, from, "Gamma is the point at infinity");
  }
  const ProofCheck log_check = VerifyLogStar(
      Context(from, self_id(), 2, "gamma-log"), level_,
      LogStarStatement{
          .prover_key = peer_key, .ciphertext = ciphertexts_.at(from).g, .x = message.gamma,
          .base = ECPoint::Generator()},
      own_params, message.log_proof);
  if (log_check != ProofCheck::kOk) {
    throw Blame(AbortReason::kInvalidLogStarProof, from,
                std::string("Gamma does not match G: ") + ProofCheckName(log_check));
  }

  const ProofCheck aff_check = VerifyAffineGroup(
      Context(from, self_id(), 2, "gamma"), level_,
      AffineGroupStatement{
          .receiver_key = own, .prover_key = peer_key, .c = k_ciphertext_, .d = message.d, .y = message.f,
          .x = message.gamma},
      own_params, message.aff_proof);
  if (aff_check != ProofCheck::kOk) {
    throw Blame(AbortReason::kInvalidAffGProof, from,
                std::string("affine proof for gamma rejected: ") + ProofCheckName(aff_check));
  }

  const ProofCheck aff_hat_check = VerifyAffineGroup(
      Context(from, self_id(), 2, "x"), level_,
      AffineGroupStatement{
          .receiver_key = own, .prover_key = peer_key, .c = k_ciphertext_, .d = message.d_hat,
          .y = message.f_hat, .x = SignerPublicShare(key_share_.core.key_info, participants(), from)},
      own_params, message.aff_hat_proof);
  if (aff_hat_check != ProofCheck::kOk) {
    throw Blame(AbortReason::kInvalidAffGProof, from,
                std::string("affine proof for x rejected: ") + ProofCheckName(aff_hat_check));
  }

  // Honest parties keep |alpha| below 2^(2*256) + 2^EllPrimeBits.
  const mpz_class bound = TwoPow(level_.EllPrimeBits() + level_.EpsilonBits() + 1);
  mpz_class alpha = key_share_.aux.paillier->DecryptSigned(message.d);
  mpz_class alpha_hat = key_share_.aux.paillier->DecryptSigned(message.d_hat);
  ScopedZeroize<mpz_class> wipe_alpha(&alpha);
  ScopedZeroize<mpz_class> wipe_alpha_hat(&alpha_hat);
  if (!IsInSignedRange(alpha, bound) || !IsInSignedRange(alpha_hat, bound)) {
    throw Blame(AbortReason::kMtaDecryptionOutOfRange, from, "MtA share decrypted outside the expected range");
  }

  gammas_[from] = message.gamma;
  alphas_[from] = Scalar(alpha);
  alpha_hats_[from] = Scalar(alpha_hat);
}

void PresignSession::HandleDelta(const Envelope& envelope) {
  size_t offset = 0;
  PeerDelta delta;
  delta.delta = ReadScalar(envelope.payload, &offset);
  delta.big_delta = ReadPoint(envelope.payload, &offset);
  EnsureFullyConsumed(envelope.payload, offset, "presign delta");
  deltas_[envelope.from] = std::move(delta);
  if (pending_delta_proofs_.contains(envelope.from)) {
    CheckDeltaProof(envelope.from);
  }
}

void PresignSession::HandleDeltaProof(const Envelope& envelope) {
  size_t offset = 0;
  LogStarProof proof = ReadLogStarProof(envelope.payload, &offset);
  EnsureFullyConsumed(envelope.payload, offset, "delta proof");
  pending_delta_proofs_[envelope.from] = std::move(proof);
  if (deltas_.contains(envelope.from)) {
    CheckDeltaProof(envelope.from);
  }
}

void PresignSession::CheckDeltaProof(PartyIndex prover) {
  const ProofCheck check = VerifyLogStar(
      Context(prover, self_id(), 3, "delta"), level_,
      LogStarStatement{
          .prover_key = AuxOf(prover).paillier, .ciphertext = ciphertexts_.at(prover).k,
          .x = deltas_.at(prover).big_delta, .base = gamma_sum_},
      AuxOf(self_id()).pedersen, pending_delta_proofs_.at(prover));
  if (check != ProofCheck::kOk) {
    throw Blame(AbortReason::kInvalidLogStarProof, prover,
                std::string("Delta does not match K: ") + ProofCheckName(check));
  }
  pending_delta_proofs_.erase(prover);
}

void PresignSession::BuildResult() {
  Scalar delta;
  std::vector<ECPoint> big_deltas;
  for (PartyIndex id : participants()) {
    delta = delta + deltas_.at(id).delta;
    big_deltas.push_back(deltas_.at(id).big_delta);
  }

  // Every proof passed, so the culprit cannot be named from this round alone.
  if (ECPoint::GeneratorMultiply(delta) != SumPoints(big_deltas)) {
    throw ProtocolAbort(AbortReason::kPresignDeltaMismatch, {}, "delta * G does not match the sum of Delta_j");
  }
  const std::optional<Scalar> delta_inv = delta.Inverse();
  if (!delta_inv.has_value()) {
    throw ProtocolAbort(AbortReason::kPresignDeltaMismatch, {}, "delta is zero");
  }

  const ECPoint r_point = gamma_sum_.Mul(*delta_inv);
  result_.emplace(self_id(), r_point, k_, chi_, participants(), key_hash_);

  k_.Zeroize();
  chi_.Zeroize();
  gamma_.Zeroize();
  SecureZeroize(&betas_);
  SecureZeroize(&beta_hats_);
  SecureZeroize(&alphas_);
  SecureZeroize(&alpha_hats_);
  BOOST_LOG_TRIVIAL(debug) << str(boost::format("presign party %1%: presignature ready for %2% signers") %
                                  self_id() % participants().size());
}

}  // namespace cggmp
