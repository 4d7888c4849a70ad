#include "cggmp/protocol/round_session.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace cggmp {

RoundSession::RoundSession(Bytes session_id,
                           PartyIndex self_id,
                           std::vector<PartyIndex> participants,
                           std::chrono::milliseconds timeout)
    : Session(std::move(session_id), self_id, timeout), participants_(std::move(participants)) {
  if (participants_.size() < 2) {
    throw LocalValidationError("a protocol run requires at least 2 participants");
  }

  bool self_present = false;
  for (PartyIndex id : participants_) {
    if (id == 0) {
      throw LocalValidationError("participants must not contain 0");
    }
    if (!participant_set_.insert(id).second) {
      throw LocalValidationError("participants must be unique");
    }
    if (id == self_id) {
      self_present = true;
    } else {
      peers_.push_back(id);
    }
  }
  if (!self_present) {
    throw LocalValidationError("self_id must be in participants");
  }
}

std::vector<Envelope> RoundSession::Start() {
  if (round_ != 0) {
    throw std::logic_error("session already started");
  }

  std::vector<Envelope> outbound;
  round_ = 1;
  BOOST_LOG_TRIVIAL(debug) << str(boost::format("%1% party %2%: entering round 1") % protocol_name() %
                                  self_id());
  if (!RunLocalStep("BeginRound", [&]() { outbound = BeginRound(round_); })) {
    return outbound;
  }
  if (DrainBuffered()) {
    Advance(&outbound);
  }
  return outbound;
}

std::vector<Envelope> RoundSession::HandleEnvelope(const Envelope& envelope) {
  std::vector<Envelope> outbound;
  if (PollTimeout() || IsTerminal()) {
    return outbound;
  }

  std::string error;
  if (!ValidateSessionBinding(envelope.session_id, envelope.to, &error)) {
    BOOST_LOG_TRIVIAL(debug) << str(boost::format("%1% party %2%: dropped envelope from %3%: %4%") %
                                    protocol_name() % self_id() % envelope.from % error);
    ++rejected_count_;
    return outbound;
  }
  if (envelope.from == self_id() || !IsParticipant(envelope.from)) {
    ++rejected_count_;
    return outbound;
  }
  if (envelope.round == 0 || envelope.round > round_count()) {
    ++rejected_count_;
    return outbound;
  }

  Touch();
  if (envelope.round < round_) {
    return outbound;
  }
  if (round_ == 0 || envelope.round > round_) {
    future_.emplace(InboxKey{envelope.round, envelope.type, envelope.from}, envelope);
    return outbound;
  }

  if (Accept(envelope)) {
    Advance(&outbound);
  }
  return outbound;
}

uint32_t RoundSession::current_round() const {
  return round_;
}

const std::vector<PartyIndex>& RoundSession::participants() const {
  return participants_;
}

size_t RoundSession::received_count_in_round() const {
  size_t count = 0;
  for (const auto& [key, envelope] : inbox_) {
    (void)envelope;
    if (std::get<0>(key) == round_) {
      ++count;
    }
  }
  return count;
}

size_t RoundSession::rejected_count() const {
  return rejected_count_;
}

std::vector<PartyIndex> RoundSession::MissingParties() const {
  std::vector<PartyIndex> missing;
  if (round_ == 0) {
    return missing;
  }
  const std::vector<RoundMessageSpec> specs = ExpectedMessages(round_);
  for (PartyIndex peer : peers_) {
    for (const RoundMessageSpec& spec : specs) {
      if (!inbox_.contains(InboxKey{round_, spec.type, peer})) {
        missing.push_back(peer);
        break;
      }
    }
  }
  return missing;
}

const std::vector<PartyIndex>& RoundSession::peers() const {
  return peers_;
}

bool RoundSession::IsParticipant(PartyIndex id) const {
  return participant_set_.contains(id);
}

Envelope RoundSession::MakeBroadcast(uint32_t type, Bytes payload) const {
  Envelope out;
  out.session_id = session_id();
  out.from = self_id();
  out.to = kBroadcastPartyId;
  out.round = round_;
  out.type = type;
  out.payload = std::move(payload);
  return out;
}

Envelope RoundSession::MakeDirect(PartyIndex to, uint32_t type, Bytes payload) const {
  Envelope out = MakeBroadcast(type, std::move(payload));
  out.to = to;
  return out;
}

std::optional<RoundMessageSpec> RoundSession::FindSpec(uint32_t round, uint32_t type) const {
  for (const RoundMessageSpec& spec : ExpectedMessages(round)) {
    if (spec.type == type) {
      return spec;
    }
  }
  return std::nullopt;
}

bool RoundSession::RoundComplete() const {
  const std::vector<RoundMessageSpec> specs = ExpectedMessages(round_);
  for (PartyIndex peer : peers_) {
    for (const RoundMessageSpec& spec : specs) {
      if (!inbox_.contains(InboxKey{round_, spec.type, peer})) {
        return false;
      }
    }
  }
  return true;
}

bool RoundSession::Accept(const Envelope& envelope) {
  const std::optional<RoundMessageSpec> spec = FindSpec(round_, envelope.type);
  if (!spec.has_value()) {
    Abort(ProtocolAbort(AbortReason::kUnexpectedMessage,
                        {envelope.from},
                        "message type " + std::to_string(envelope.type) + " is not expected in round " +
                            std::to_string(round_)));
    return false;
  }
  const bool scope_ok = spec->scope == MessageScope::kBroadcast ? envelope.to == kBroadcastPartyId
                                                                : envelope.to == self_id();
  if (!scope_ok) {
    Abort(ProtocolAbort(AbortReason::kUnexpectedMessage,
                        {envelope.from},
                        "message type " + std::to_string(envelope.type) + " sent with the wrong scope"));
    return false;
  }

  const InboxKey key{round_, envelope.type, envelope.from};
  if (inbox_.contains(key)) {
    return true;
  }
  inbox_.emplace(key, envelope);

  try {
    ValidateMessage(round_, envelope);
  } catch (const ProtocolAbort& abort) {
    Abort(abort);
    return false;
  } catch (const CryptoFailure&) {
    throw;
  } catch (const std::exception& ex) {
    Abort(ProtocolAbort(AbortReason::kMalformedMessage, {envelope.from}, ex.what()));
    return false;
  }
  return true;
}

bool RoundSession::DrainBuffered() {
  for (auto it = future_.begin(); it != future_.end();) {
    if (std::get<0>(it->first) != round_) {
      ++it;
      continue;
    }
    const Envelope envelope = std::move(it->second);
    it = future_.erase(it);
    if (!Accept(envelope)) {
      return false;
    }
  }
  return true;
}

bool RoundSession::RunLocalStep(const char* step, const std::function<void()>& fn) {
  try {
    fn();
  } catch (const ProtocolAbort& abort) {
    Abort(abort);
    return false;
  } catch (const CryptoFailure&) {
    throw;
  } catch (const std::exception& ex) {
    Abort(ProtocolAbort(AbortReason::kLocalFailure, {},
                        str(boost::format("%1% of round %2% failed: %3%") % step % round_ % ex.what())));
    return false;
  }
  return !IsTerminal();
}

void RoundSession::Advance(std::vector<Envelope>* outbound) {
  while (!IsTerminal() && RoundComplete()) {
    if (!RunLocalStep("FinishRound", [&]() { FinishRound(round_); })) {
      return;
    }
    if (round_ == round_count()) {
      Complete();
      return;
    }

    ++round_;
    BOOST_LOG_TRIVIAL(debug) << str(boost::format("%1% party %2%: entering round %3%") % protocol_name() %
                                    self_id() % round_);
    const bool begun = RunLocalStep("BeginRound", [&]() {
      std::vector<Envelope> produced = BeginRound(round_);
      for (Envelope& envelope : produced) {
        outbound->push_back(std::move(envelope));
      }
    });
    if (!begun || !DrainBuffered()) {
      return;
    }
  }
}

}  // namespace cggmp
