#pragma once

#include <string>
#include <unordered_map>

#include "cggmp/net/transport.hpp"

namespace cggmp {

// Per-party demultiplexer: one transport endpoint can carry several
// concurrent protocol runs, told apart by session id.
class SessionRouter {
 public:
  explicit SessionRouter(PartyIndex self_id);

  void RegisterSession(const Bytes& session_id, EnvelopeHandler handler);
  void UnregisterSession(const Bytes& session_id);
  bool HasSession(const Bytes& session_id) const;

  bool Route(const Envelope& envelope);
  size_t rejected_count() const;

 private:
  PartyIndex self_id_;
  std::unordered_map<std::string, EnvelopeHandler> handlers_;
  size_t rejected_count_ = 0;
};

}  // namespace cggmp
