#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include <gmpxx.h>

#include "cggmp/crypto/feldman.hpp"
#include "cggmp/crypto/paillier.hpp"
#include "cggmp/crypto/ring_pedersen.hpp"
#include "cggmp/crypto/security_level.hpp"
#include "cggmp/protocol/key_share.hpp"
#include "cggmp/protocol/round_session.hpp"
#include "cggmp/zk/no_small_factor.hpp"
#include "cggmp/zk/paillier_mod.hpp"
#include "cggmp/zk/ring_pedersen_params.hpp"

namespace cggmp {

enum class AuxInfoMessageType : uint32_t {
  kCommit = 2001,
  kEcho = 2002,
  kDecommit = 2003,
  kProofs = 2004,
};

struct AuxInfoSessionConfig {
  Bytes session_id;
  PartyIndex self_id = 0;
  std::vector<PartyIndex> participants;
  SecurityLevel level = SecurityLevel::ReasonablySecure();
  // Also re-randomises key_share with a sharing of zero.
  bool refresh_shares = false;
  std::optional<CoreKeyShare> key_share;
  bool enforce_reliable_broadcast = true;
  // Key generated ahead of time; sampled when the session starts otherwise.
  std::shared_ptr<const PaillierProvider> paillier;
  std::chrono::milliseconds timeout = std::chrono::seconds(60);
};

struct AuxInfoResult {
  AuxInfo aux_info;
  // Set when the session refreshed a key share.
  std::optional<CoreKeyShare> refreshed_share;
};

class AuxInfoSession : public RoundSession {
 public:
  explicit AuxInfoSession(AuxInfoSessionConfig cfg);
  ~AuxInfoSession() override;

  bool refresh_shares() const;

  bool HasResult() const;
  const AuxInfoResult& result() const;

 protected:
  uint32_t round_count() const override;
  const char* protocol_name() const override;
  std::vector<RoundMessageSpec> ExpectedMessages(uint32_t round) const override;
  std::vector<Envelope> BeginRound(uint32_t round) override;
  void ValidateMessage(uint32_t round, const Envelope& envelope) override;
  void FinishRound(uint32_t round) override;

 private:
  enum class Stage {
    kCommit,
    kEcho,
    kDecommit,
    kProofs,
  };

  struct Decommitment {
    RingPedersenParams pedersen;
    RingPedersenParamProof prm_proof;
    Bytes rid;
    std::vector<ECPoint> zero_commitments;
    Bytes nonce;
  };

  struct PeerProofs {
    PaillierModProof mod_proof;
    NoSmallFactorProof fac_proof;
    std::optional<mpz_class> encrypted_share;
  };

  Stage StageOf(uint32_t round) const;
  uint32_t decommit_round() const;
  size_t zero_sharing_degree() const;

  Bytes EncodeDecommitmentBody(const Decommitment& decommitment) const;
  Decommitment DecodeDecommitment(std::span<const uint8_t> payload) const;
  // sid || party || body, the message the round 1 hash commits to.
  Bytes DecommitmentMessage(PartyIndex party, const Decommitment& decommitment) const;
  Bytes EncodePeerProofs(const PeerProofs& proofs) const;
  PeerProofs DecodePeerProofs(std::span<const uint8_t> payload) const;

  ProofContext Context(PartyIndex prover, PartyIndex verifier, uint32_t round, bool bind_rid) const;
  void HandleDecommit(const Envelope& envelope);
  void HandleProofs(const Envelope& envelope);
  void BuildResult();

  SecurityLevel level_;
  bool refresh_shares_ = false;
  std::optional<CoreKeyShare> key_share_;
  bool enforce_reliable_broadcast_ = true;

  std::shared_ptr<const PaillierProvider> paillier_;
  RingPedersenWitness pedersen_witness_;
  Polynomial zero_polynomial_;
  Decommitment local_decommitment_;

  std::unordered_map<PartyIndex, Bytes> commitments_;
  std::unordered_map<PartyIndex, Decommitment> decommitments_;
  std::unordered_map<PartyIndex, Scalar> zero_shares_;
  Bytes rid_;

  std::optional<AuxInfoResult> result_;
};

}  // namespace cggmp
