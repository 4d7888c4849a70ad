#pragma once

#include <chrono>
#include <optional>
#include <unordered_map>
#include <vector>

#include "cggmp/crypto/ec_point.hpp"
#include "cggmp/crypto/feldman.hpp"
#include "cggmp/crypto/scalar.hpp"
#include "cggmp/protocol/key_share.hpp"
#include "cggmp/protocol/round_session.hpp"
#include "cggmp/zk/schnorr.hpp"

namespace cggmp {

enum class KeygenMessageType : uint32_t {
  kCommit = 1001,
  kEcho = 1002,
  kDecommit = 1003,
  kShare = 1004,
  kSchnorr = 1005,
};

struct KeygenSessionConfig {
  Bytes session_id;
  PartyIndex self_id = 0;
  std::vector<PartyIndex> participants;
  // Unset selects n-of-n mode with additive shares.
  std::optional<uint32_t> threshold;
  bool hd_enabled = false;
  bool enforce_reliable_broadcast = true;
  std::chrono::milliseconds timeout = std::chrono::seconds(30);
};

class KeygenSession : public RoundSession {
 public:
  explicit KeygenSession(KeygenSessionConfig cfg);
  ~KeygenSession() override;

  bool threshold_mode() const;
  uint32_t threshold() const;

  bool HasResult() const;
  const CoreKeyShare& result() const;

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
    kSchnorr,
  };

  struct Decommitment {
    Bytes rid;
    std::vector<ECPoint> commitments;
    ECPoint schnorr_commit;
    std::optional<Bytes> chain_code;
    Bytes nonce;
  };

  Stage StageOf(uint32_t round) const;
  // sid || party || body, the message the round 1 hash commits to.
  Bytes DecommitmentMessage(PartyIndex party, const Decommitment& decommitment) const;
  Bytes EncodeDecommitmentBody(const Decommitment& decommitment) const;
  Decommitment DecodeDecommitment(std::span<const uint8_t> payload) const;

  void HandleDecommit(const Envelope& envelope);
  void HandleShare(const Envelope& envelope);
  void CheckShare(PartyIndex dealer) const;
  void HandleSchnorr(const Envelope& envelope);
  ProofContext SchnorrContext(PartyIndex prover, uint32_t round) const;
  void BuildResult();

  std::optional<uint32_t> threshold_;
  bool hd_enabled_ = false;
  bool enforce_reliable_broadcast_ = true;

  Polynomial polynomial_;
  SchnorrCommitment schnorr_commitment_;
  Decommitment local_decommitment_;

  std::unordered_map<PartyIndex, Bytes> commitments_;
  std::unordered_map<PartyIndex, Decommitment> decommitments_;
  std::unordered_map<PartyIndex, Scalar> shares_;
  Bytes rid_;

  std::optional<CoreKeyShare> result_;
};

}  // namespace cggmp
