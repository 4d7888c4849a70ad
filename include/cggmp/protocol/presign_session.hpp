#pragma once

#include <chrono>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <gmpxx.h>

#include "cggmp/crypto/ec_point.hpp"
#include "cggmp/crypto/scalar.hpp"
#include "cggmp/crypto/security_level.hpp"
#include "cggmp/protocol/key_share.hpp"
#include "cggmp/protocol/round_session.hpp"
#include "cggmp/zk/affine_group.hpp"
#include "cggmp/zk/enc_range.hpp"
#include "cggmp/zk/log_star.hpp"

namespace cggmp {

enum class PresignMessageType : uint32_t {
  kCiphertexts = 3001,
  kEncProof = 3002,
  kMta = 3003,
  kDelta = 3004,
  kDeltaProof = 3005,
};

struct PresignatureSecrets {
  Scalar k;
  Scalar chi;
};

// Output of one presigning run: R = delta^-1 * Gamma and this party's
// additive shares of k and chi = k * x. The secrets can be taken exactly once.
class Presignature {
 public:
  Presignature(PartyIndex owner,
               ECPoint r_point,
               Scalar k,
               Scalar chi,
               std::vector<PartyIndex> signers,
               Bytes key_hash);
  ~Presignature();

  Presignature(const Presignature&) = delete;
  Presignature& operator=(const Presignature&) = delete;
  Presignature(Presignature&& other) noexcept;
  Presignature& operator=(Presignature&& other) noexcept;

  PartyIndex owner() const;
  const ECPoint& r_point() const;
  const std::vector<PartyIndex>& signers() const;
  const Bytes& key_hash() const;
  bool consumed() const;

  // Throws LocalValidationError when the presignature was already used.
  PresignatureSecrets Consume();

 private:
  PartyIndex owner_ = 0;
  ECPoint r_point_;
  std::optional<PresignatureSecrets> secrets_;
  std::vector<PartyIndex> signers_;
  Bytes key_hash_;
};

struct PresignSessionConfig {
  Bytes session_id;
  PartyIndex self_id = 0;
  std::vector<PartyIndex> signers;
  SecurityLevel level = SecurityLevel::ReasonablySecure();
  KeyShare key_share;
  std::chrono::milliseconds timeout = std::chrono::seconds(60);
};

class PresignSession : public RoundSession {
 public:
  explicit PresignSession(PresignSessionConfig cfg);
  ~PresignSession() override;

  bool HasResult() const;
  // Moves the presignature out; later calls throw.
  Presignature TakeResult();

 protected:
  uint32_t round_count() const override;
  const char* protocol_name() const override;
  std::vector<RoundMessageSpec> ExpectedMessages(uint32_t round) const override;
  std::vector<Envelope> BeginRound(uint32_t round) override;
  void ValidateMessage(uint32_t round, const Envelope& envelope) override;
  void FinishRound(uint32_t round) override;

 private:
  struct PeerCiphertexts {
    mpz_class k;
    mpz_class g;
  };

  struct MtaMessage {
    ECPoint gamma;
    mpz_class d;
    mpz_class f;
    mpz_class d_hat;
    mpz_class f_hat;
    AffineGroupProof aff_proof;
    AffineGroupProof aff_hat_proof;
    LogStarProof log_proof;
  };

  struct PeerDelta {
    Scalar delta;
    ECPoint big_delta;
  };

  ProofContext Context(PartyIndex prover, PartyIndex verifier, uint32_t round, std::string_view label) const;
  const PartyAuxInfo& AuxOf(PartyIndex party) const;
  PaillierPublicKey OwnKey() const;

  Bytes EncodeMta(const MtaMessage& message) const;
  MtaMessage DecodeMta(std::span<const uint8_t> payload) const;

  std::vector<Envelope> BuildRound1();
  std::vector<Envelope> BuildRound2();
  std::vector<Envelope> BuildRound3();

  void HandleCiphertexts(const Envelope& envelope);
  void HandleEncProof(const Envelope& envelope);
  void CheckEncProof(PartyIndex prover);
  void HandleMta(const Envelope& envelope);
  void HandleDelta(const Envelope& envelope);
  void HandleDeltaProof(const Envelope& envelope);
  void CheckDeltaProof(PartyIndex prover);
  void BuildResult();

  SecurityLevel level_;
  KeyShare key_share_;
  Bytes key_hash_;
  Scalar weighted_x_;

  Scalar k_;
  Scalar gamma_;
  mpz_class k_rho_;
  mpz_class gamma_nu_;
  mpz_class k_ciphertext_;
  mpz_class g_ciphertext_;
  ECPoint big_gamma_;
  ECPoint gamma_sum_;
  ECPoint big_delta_;
  Scalar delta_;
  Scalar chi_;

  // beta and beta-hat this party keeps for every peer.
  std::unordered_map<PartyIndex, Scalar> betas_;
  std::unordered_map<PartyIndex, Scalar> beta_hats_;
  std::unordered_map<PartyIndex, Scalar> alphas_;
  std::unordered_map<PartyIndex, Scalar> alpha_hats_;

  std::unordered_map<PartyIndex, PeerCiphertexts> ciphertexts_;
  std::unordered_map<PartyIndex, EncRangeProof> pending_enc_proofs_;
  std::unordered_map<PartyIndex, ECPoint> gammas_;
  std::unordered_map<PartyIndex, PeerDelta> deltas_;
  std::unordered_map<PartyIndex, LogStarProof> pending_delta_proofs_;

  std::optional<Presignature> result_;
};

}  // namespace cggmp
