#include "cggmp/protocol/session.hpp"

#include <stdexcept>
#include <utility>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include "cggmp/common/bytes.hpp"
#include "cggmp/net/envelope.hpp"

namespace cggmp {

const char* SessionStatusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::kRunning:
      return "running";
    case SessionStatus::kCompleted:
      return "completed";
    case SessionStatus::kAborted:
      return "aborted";
    case SessionStatus::kTimedOut:
      return "timed out";
  }
  return "unknown";
}

Session::Session(Bytes session_id,
                 PartyIndex self_id,
                 std::chrono::milliseconds timeout)
    : session_id_(std::move(session_id)),
      self_id_(self_id),
      timeout_(timeout),
      last_activity_(std::chrono::steady_clock::now()) {
  if (session_id_.empty()) {
    throw LocalValidationError("Session ID must not be empty");
  }
  if (self_id_ == 0) {
    throw LocalValidationError("self_id must be non-zero");
  }
  if (timeout_.count() <= 0) {
    throw LocalValidationError("timeout must be positive");
  }
}

const Bytes& Session::session_id() const {
  return session_id_;
}

PartyIndex Session::self_id() const {
  return self_id_;
}

SessionStatus Session::status() const {
  return status_;
}

bool Session::IsTerminal() const {
  return status_ != SessionStatus::kRunning;
}

const std::string& Session::abort_reason() const {
  return abort_reason_;
}

const std::optional<ProtocolAbort>& Session::abort_detail() const {
  return abort_detail_;
}

void Session::RethrowIfAborted() const {
  if (abort_detail_.has_value()) {
    throw *abort_detail_;
  }
}

bool Session::PollTimeout(std::chrono::steady_clock::time_point now) {
  if (IsTerminal()) {
    return status_ == SessionStatus::kTimedOut;
  }

  if (now - last_activity_ > timeout_) {
    status_ = SessionStatus::kTimedOut;
    abort_detail_.emplace(AbortReason::kTimedOut, MissingParties(), "session timed out");
    abort_reason_ = abort_detail_->what();
    BOOST_LOG_TRIVIAL(error) << str(boost::format("party %1% session %2%: %3%") % self_id_ %
                                    ToHex(session_id_) % abort_reason_);
    return true;
  }
  return false;
}

bool Session::ValidateSessionBinding(const Bytes& msg_session_id,
                                     PartyIndex to,
                                     std::string* error) const {
  if (msg_session_id != session_id_) {
    if (error != nullptr) {
      *error = "session_id mismatch";
    }
    return false;
  }

  if (to != self_id_ && to != kBroadcastPartyId) {
    if (error != nullptr) {
      *error = "message recipient mismatch";
    }
    return false;
  }

  return true;
}

void Session::Touch(std::chrono::steady_clock::time_point now) {
  last_activity_ = now;
}

void Session::Abort(const ProtocolAbort& abort) {
  if (IsTerminal()) {
    return;
  }
  status_ = SessionStatus::kAborted;
  abort_detail_ = abort;
  abort_reason_ = abort.what();
  BOOST_LOG_TRIVIAL(error) << str(boost::format("party %1% session %2% aborted: %3%") % self_id_ %
                                  ToHex(session_id_) % abort_reason_);
}

void Session::Complete() {
  if (IsTerminal()) {
    return;
  }
  status_ = SessionStatus::kCompleted;
  abort_reason_.clear();
  BOOST_LOG_TRIVIAL(info) << str(boost::format("party %1% session %2% completed") % self_id_ %
                                 ToHex(session_id_));
}

}  // namespace cggmp
