#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <tuple>
#include <unordered_set>
#include <vector>

#include "cggmp/net/envelope.hpp"
#include "cggmp/protocol/session.hpp"

namespace cggmp {

enum class MessageScope {
  kBroadcast = 0,
  kDirect = 1,
};

// One message kind a round expects from every other participant.
struct RoundMessageSpec {
  uint32_t type = 0;
  MessageScope scope = MessageScope::kBroadcast;
};

// Drives a fixed sequence of rounds. For round k the subclass emits its
// outbound messages in BeginRound, checks each inbound message as soon as it
// arrives in ValidateMessage, and folds the complete round in FinishRound.
// Messages for later rounds wait in the inbox until their round starts.
class RoundSession : public Session {
 public:
  RoundSession(Bytes session_id,
               PartyIndex self_id,
               std::vector<PartyIndex> participants,
               std::chrono::milliseconds timeout);

  // Enters round 1 and returns its outbound messages.
  std::vector<Envelope> Start();

  // Returns the outbound messages of every round the envelope unblocked.
  std::vector<Envelope> HandleEnvelope(const Envelope& envelope);

  uint32_t current_round() const;
  const std::vector<PartyIndex>& participants() const;
  size_t received_count_in_round() const;
  size_t rejected_count() const;

 protected:
  virtual uint32_t round_count() const = 0;
  virtual const char* protocol_name() const = 0;
  virtual std::vector<RoundMessageSpec> ExpectedMessages(uint32_t round) const = 0;
  virtual std::vector<Envelope> BeginRound(uint32_t round) = 0;
  // Throws ProtocolAbort for attributable failures; any other exception is
  // treated as a malformed message from the sender.
  virtual void ValidateMessage(uint32_t round, const Envelope& envelope) = 0;
  // BeginRound and FinishRound report attributable failures as ProtocolAbort.
  // CryptoFailure propagates to the caller; any other exception aborts the
  // session with kLocalFailure and no culprit.
  virtual void FinishRound(uint32_t round) = 0;

  std::vector<PartyIndex> MissingParties() const override;

  const std::vector<PartyIndex>& peers() const;
  bool IsParticipant(PartyIndex id) const;

  Envelope MakeBroadcast(uint32_t type, Bytes payload) const;
  Envelope MakeDirect(PartyIndex to, uint32_t type, Bytes payload) const;

 private:
  using InboxKey = std::tuple<uint32_t, uint32_t, PartyIndex>;

  std::optional<RoundMessageSpec> FindSpec(uint32_t round, uint32_t type) const;
  bool RoundComplete() const;
  // Returns false once the session is terminal.
  bool Accept(const Envelope& envelope);
  // Feeds buffered messages of the current round; false once aborted.
  bool DrainBuffered();
  // Runs BeginRound or FinishRound; false once the session is terminal.
  bool RunLocalStep(const char* step, const std::function<void()>& fn);
  void Advance(std::vector<Envelope>* outbound);

  std::vector<PartyIndex> participants_;
  std::vector<PartyIndex> peers_;
  std::unordered_set<PartyIndex> participant_set_;

  uint32_t round_ = 0;
  std::map<InboxKey, Envelope> inbox_;
  std::map<InboxKey, Envelope> future_;
  size_t rejected_count_ = 0;
};

}  // namespace cggmp
