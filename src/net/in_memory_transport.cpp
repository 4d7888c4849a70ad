#include "cggmp/net/in_memory_transport.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "cggmp/common/errors.hpp"

namespace cggmp {

std::shared_ptr<InMemoryTransport> InMemoryNetwork::CreateEndpoint(PartyIndex self_id) {
  if (self_id == 0) {
    throw std::invalid_argument("InMemory endpoint self_id must be non-zero");
  }

  auto endpoint = std::shared_ptr<InMemoryTransport>(
      new InMemoryTransport(self_id, shared_from_this()));

  std::lock_guard<std::mutex> lock(mu_);
  endpoints_[self_id] = endpoint;
  return endpoint;
}

size_t InMemoryNetwork::PumpAll() {
  std::vector<std::shared_ptr<InMemoryTransport>> targets;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& [id, weak] : endpoints_) {
      (void)id;
      if (auto endpoint = weak.lock()) {
        targets.push_back(std::move(endpoint));
      }
    }
  }

  size_t delivered = 0;
  for (const auto& target : targets) {
    delivered += target->DeliverPending();
  }
  return delivered;
}

bool InMemoryNetwork::Send(const Envelope& envelope, PartyIndex to) {
  std::shared_ptr<InMemoryTransport> target;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = endpoints_.find(to);
    if (it == endpoints_.end()) {
      return false;
    }
    target = it->second.lock();
    if (!target) {
      endpoints_.erase(it);
      return false;
    }
  }

  target->Enqueue(envelope);
  return true;
}

void InMemoryNetwork::Broadcast(const Envelope& envelope, PartyIndex from) {
  std::vector<std::shared_ptr<InMemoryTransport>> targets;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = endpoints_.begin(); it != endpoints_.end();) {
      auto endpoint = it->second.lock();
      if (!endpoint) {
        it = endpoints_.erase(it);
        continue;
      }

      if (it->first != from) {
        targets.push_back(std::move(endpoint));
      }
      ++it;
    }
  }

  for (const auto& target : targets) {
    target->Enqueue(envelope);
  }
}

void InMemoryNetwork::Unregister(PartyIndex self_id) {
  std::lock_guard<std::mutex> lock(mu_);
  endpoints_.erase(self_id);
}

InMemoryTransport::InMemoryTransport(PartyIndex self_id,
                                     std::shared_ptr<InMemoryNetwork> network)
    : self_id_(self_id), network_(std::move(network)) {
  if (self_id_ == 0) {
    throw std::invalid_argument("InMemoryTransport self_id must be non-zero");
  }
  if (!network_) {
    throw std::invalid_argument("InMemoryTransport requires a network");
  }
}

InMemoryTransport::~InMemoryTransport() {
  if (network_) {
    network_->Unregister(self_id_);
  }
}

void InMemoryTransport::Send(PartyIndex to, const Envelope& envelope) {
  if (envelope.from != self_id_) {
    throw std::invalid_argument("Envelope.from must match transport self_id");
  }

  Envelope outbound = envelope;
  outbound.to = to;
  if (!network_->Send(outbound, to)) {
    throw TransportError("Send target " + std::to_string(to) + " not found");
  }
}

void InMemoryTransport::Broadcast(const Envelope& envelope) {
  if (envelope.from != self_id_) {
    throw std::invalid_argument("Envelope.from must match transport self_id");
  }

  Envelope outbound = envelope;
  outbound.to = kBroadcastPartyId;
  network_->Broadcast(outbound, self_id_);
}

void InMemoryTransport::RegisterHandler(EnvelopeHandler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  handler_ = std::move(handler);
}

size_t InMemoryTransport::DeliverPending() {
  std::deque<Envelope> batch;
  EnvelopeHandler handler;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!handler_) {
      return 0;
    }
    batch.swap(inbox_);
    handler = handler_;
  }

  for (const Envelope& envelope : batch) {
    handler(envelope);
  }
  return batch.size();
}

size_t InMemoryTransport::pending_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return inbox_.size();
}

PartyIndex InMemoryTransport::self_id() const {
  return self_id_;
}

void InMemoryTransport::Enqueue(const Envelope& envelope) {
  std::lock_guard<std::mutex> lock(mu_);
  inbox_.push_back(envelope);
}

}  // namespace cggmp
