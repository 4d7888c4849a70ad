#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "cggmp/net/transport.hpp"

namespace cggmp {

class InMemoryTransport;

// Process-local network. Sends are queued at the recipient and handed to its
// handler only when the recipient pumps, so handlers never re-enter.
class InMemoryNetwork : public std::enable_shared_from_this<InMemoryNetwork> {
 public:
  std::shared_ptr<InMemoryTransport> CreateEndpoint(PartyIndex self_id);

  // Delivers queued envelopes on every endpoint; returns how many were handed over.
  size_t PumpAll();

 private:
  friend class InMemoryTransport;

  bool Send(const Envelope& envelope, PartyIndex to);
  void Broadcast(const Envelope& envelope, PartyIndex from);
  void Unregister(PartyIndex self_id);

  std::unordered_map<PartyIndex, std::weak_ptr<InMemoryTransport>> endpoints_;
  std::mutex mu_;
};

class InMemoryTransport : public ITransport,
                          public std::enable_shared_from_this<InMemoryTransport> {
 public:
  InMemoryTransport(PartyIndex self_id, std::shared_ptr<InMemoryNetwork> network);
  ~InMemoryTransport() override;

  InMemoryTransport(const InMemoryTransport&) = delete;
  InMemoryTransport& operator=(const InMemoryTransport&) = delete;

  void Send(PartyIndex to, const Envelope& envelope) override;
  void Broadcast(const Envelope& envelope) override;
  void RegisterHandler(EnvelopeHandler handler) override;

  // Hands every queued envelope to the handler.
  size_t DeliverPending();
  size_t pending_count() const;

  PartyIndex self_id() const;

 private:
  friend class InMemoryNetwork;
  void Enqueue(const Envelope& envelope);

  PartyIndex self_id_;
  std::shared_ptr<InMemoryNetwork> network_;
  mutable std::mutex mu_;
  EnvelopeHandler handler_;
  std::deque<Envelope> inbox_;
};

}  // namespace cggmp
