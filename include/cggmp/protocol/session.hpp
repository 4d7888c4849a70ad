#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "cggmp/common/bytes.hpp"
#include "cggmp/common/errors.hpp"
#include "cggmp/protocol/types.hpp"

namespace cggmp {

enum class SessionStatus {
  kRunning = 0,
  kCompleted = 1,
  kAborted = 2,
  kTimedOut = 3,
};

const char* SessionStatusName(SessionStatus status);

// Lifecycle shared by every protocol run: binding to one session id and one
// local party, inactivity timeout and a terminal status that never reverts.
class Session {
 public:
  Session(Bytes session_id,
          PartyIndex self_id,
          std::chrono::milliseconds timeout);
  virtual ~Session() = default;

  const Bytes& session_id() const;
  PartyIndex self_id() const;

  SessionStatus status() const;
  bool IsTerminal() const;
  const std::string& abort_reason() const;
  // Set whenever the session aborted or timed out.
  const std::optional<ProtocolAbort>& abort_detail() const;
  // Throws the recorded ProtocolAbort, if any.
  void RethrowIfAborted() const;

  bool PollTimeout(std::chrono::steady_clock::time_point now =
                       std::chrono::steady_clock::now());

 protected:
  bool ValidateSessionBinding(const Bytes& msg_session_id,
                              PartyIndex to,
                              std::string* error) const;

  // Parties blamed when the session times out.
  virtual std::vector<PartyIndex> MissingParties() const { return {}; }

  void Touch(std::chrono::steady_clock::time_point now =
                 std::chrono::steady_clock::now());
  void Abort(const ProtocolAbort& abort);
  void Complete();

 private:
  Bytes session_id_;
  PartyIndex self_id_;
  std::chrono::milliseconds timeout_;
  std::chrono::steady_clock::time_point last_activity_;

  SessionStatus status_ = SessionStatus::kRunning;
  std::string abort_reason_;
  std::optional<ProtocolAbort> abort_detail_;
};

}  // namespace cggmp
