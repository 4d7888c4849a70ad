#include "cggmp/protocol/session_router.hpp"

#include <utility>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include "cggmp/common/errors.hpp"
#include "cggmp/net/envelope.hpp"

namespace cggmp {

SessionRouter::SessionRouter(PartyIndex self_id) : self_id_(self_id) {
  if (self_id_ == 0) {
    throw LocalValidationError("SessionRouter self_id must be non-zero");
  }
}

void SessionRouter::RegisterSession(const Bytes& session_id, EnvelopeHandler handler) {
  if (session_id.empty()) {
    throw LocalValidationError("session_id must not be empty");
  }
  if (!handler) {
    throw LocalValidationError("handler must not be empty");
  }
  if (!handlers_.emplace(BytesToKey(session_id), std::move(handler)).second) {
    throw LocalValidationError("session " + ToHex(session_id) + " is already registered");
  }
}

void SessionRouter::UnregisterSession(const Bytes& session_id) {
  handlers_.erase(BytesToKey(session_id));
}

bool SessionRouter::HasSession(const Bytes& session_id) const {
  return handlers_.contains(BytesToKey(session_id));
}

bool SessionRouter::Route(const Envelope& envelope) {
  if (envelope.session_id.empty() || envelope.type == 0 || envelope.round == 0 ||
      (envelope.to != self_id_ && envelope.to != kBroadcastPartyId)) {
    ++rejected_count_;
    return false;
  }

  const auto it = handlers_.find(BytesToKey(envelope.session_id));
  if (it == handlers_.end()) {
    BOOST_LOG_TRIVIAL(debug) << str(boost::format("party %1%: no session %2% for envelope from %3%") %
                                    self_id_ % ToHex(envelope.session_id) % envelope.from);
    ++rejected_count_;
    return false;
  }

  it->second(envelope);
  return true;
}

size_t SessionRouter::rejected_count() const {
  return rejected_count_;
}

}  // namespace cggmp
