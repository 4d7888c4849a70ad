#pragma once

#include <functional>

#include "cggmp/net/envelope.hpp"

namespace cggmp {

using EnvelopeHandler = std::function<void(const Envelope& envelope)>;

// Authenticated channel: the transport vouches for Envelope::from. Delivery
// failures surface as TransportError.
class ITransport {
 public:
  virtual ~ITransport() = default;

  virtual void Send(PartyIndex to, const Envelope& envelope) = 0;
  virtual void Broadcast(const Envelope& envelope) = 0;

  virtual void RegisterHandler(EnvelopeHandler handler) = 0;
};

}  // namespace cggmp
