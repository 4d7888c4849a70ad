#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "cggmp/common/bytes.hpp"
#include "cggmp/common/errors.hpp"
#include "cggmp/common/logging.hpp"
#include "cggmp/common/thread_pool.hpp"
#include "cggmp/net/envelope.hpp"
#include "cggmp/net/in_memory_transport.hpp"
#include "cggmp/protocol/round_session.hpp"
#include "cggmp/protocol/runner.hpp"
#include "cggmp/protocol/session_router.hpp"

namespace {

using cggmp::AbortReason;
using cggmp::Bytes;
using cggmp::Envelope;
using cggmp::MessageScope;
using cggmp::PartyIndex;
using cggmp::ProtocolAbort;
using cggmp::RoundMessageSpec;
using cggmp::SessionStatus;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

const Bytes kSessionId = {0x5E, 0x55, 0x10, 0x01};
constexpr uint32_t kAnnounce = 10;
constexpr uint32_t kReply = 20;
constexpr uint8_t kPoison = 0xFF;

// Two rounds: everyone broadcasts its id, then sends each peer ten times its id.
class CountingSession : public cggmp::RoundSession {
 public:
  CountingSession(PartyIndex self_id, std::vector<PartyIndex> participants)
      : RoundSession(kSessionId, self_id, std::move(participants), std::chrono::seconds(5)) {}

  uint32_t sum() const { return sum_; }
  uint32_t finished_rounds() const { return finished_rounds_; }

 protected:
  uint32_t round_count() const override { return 2; }
  const char* protocol_name() const override { return "counting"; }

  std::vector<RoundMessageSpec> ExpectedMessages(uint32_t round) const override {
    if (round == 1) {
      return {{kAnnounce, MessageScope::kBroadcast}};
    }
    return {{kReply, MessageScope::kDirect}};
  }

  std::vector<Envelope> BeginRound(uint32_t round) override {
    if (round == 1) {
      return {MakeBroadcast(kAnnounce, Bytes{static_cast<uint8_t>(self_id())})};
    }
    std::vector<Envelope> out;
    for (PartyIndex peer : peers()) {
      out.push_back(MakeDirect(peer, kReply, Bytes{static_cast<uint8_t>(self_id() * 10)}));
    }
    return out;
  }

  void ValidateMessage(uint32_t round, const Envelope& envelope) override {
    (void)round;
    if (envelope.payload.size() != 1) {
      throw std::invalid_argument("counting payload must be one byte");
    }
    if (envelope.payload[0] == kPoison) {
      throw ProtocolAbort(AbortReason::kInvalidDecommitment, {envelope.from}, "poisoned value");
    }
    sum_ += envelope.payload[0];
  }

  void FinishRound(uint32_t round) override {
    (void)round;
    ++finished_rounds_;
  }

 private:
  uint32_t sum_ = 0;
  uint32_t finished_rounds_ = 0;
};

// Folding round 1 fails, either with a local error or a crypto failure.
class FailingFinishSession : public CountingSession {
 public:
  FailingFinishSession(PartyIndex self_id, std::vector<PartyIndex> participants, bool crypto_failure)
      : CountingSession(self_id, std::move(participants)), crypto_failure_(crypto_failure) {}

 protected:
  void FinishRound(uint32_t round) override {
    if (crypto_failure_) {
      throw cggmp::CryptoFailure("combined value does not verify");
    }
    throw std::out_of_range("no local state for round " + std::to_string(round));
  }

 private:
  bool crypto_failure_;
};

Envelope MakeEnvelope(PartyIndex from, PartyIndex to, uint32_t round, uint32_t type, Bytes payload) {
  Envelope out;
  out.session_id = kSessionId;
  out.from = from;
  out.to = to;
  out.round = round;
  out.type = type;
  out.payload = std::move(payload);
  return out;
}

void ExpectAbort(const CountingSession& session, AbortReason reason, PartyIndex culprit, const std::string& what) {
  Expect(session.status() == SessionStatus::kAborted, what + ": session should abort");
  Expect(session.abort_detail().has_value(), what + ": abort detail recorded");
  Expect(session.abort_detail()->reason() == reason, what + ": abort reason");
  Expect(session.abort_detail()->culprits() == std::vector<PartyIndex>{culprit}, what + ": culprit");
  ExpectThrow([&]() { session.RethrowIfAborted(); }, what + ": RethrowIfAborted throws");
}

void TestEnvelopeRoundTrip() {
  const Envelope envelope = MakeEnvelope(1, cggmp::kBroadcastPartyId, 3, 42, Bytes{0xAA, 0xBB, 0xCC});
  const Bytes encoded = cggmp::EncodeEnvelope(envelope);
  const Envelope decoded = cggmp::DecodeEnvelope(encoded);

  Expect(decoded.session_id == envelope.session_id, "Envelope session_id round-trip");
  Expect(decoded.from == envelope.from && decoded.to == envelope.to, "Envelope addressing round-trip");
  Expect(decoded.round == 3 && decoded.type == 42, "Envelope round and type round-trip");
  Expect(decoded.payload == envelope.payload, "Envelope payload round-trip");

  Bytes truncated = encoded;
  truncated.pop_back();
  ExpectThrow([&]() { (void)cggmp::DecodeEnvelope(truncated); }, "Envelope rejects truncation");

  Envelope large = envelope;
  large.session_id.assign(80, 0x11);
  const Bytes encoded_large = cggmp::EncodeEnvelope(large);
  ExpectThrow([&]() { (void)cggmp::DecodeEnvelope(encoded_large); }, "Envelope rejects oversized session_id");
}

void TestSessionRouter() {
  cggmp::SessionRouter router(1);
  size_t delivered = 0;
  router.RegisterSession(kSessionId, [&delivered](const Envelope&) { ++delivered; });
  Expect(router.HasSession(kSessionId), "registered session is known");
  ExpectThrow([&]() { router.RegisterSession(kSessionId, [](const Envelope&) {}); },
              "a session id can be registered once");

  Expect(router.Route(MakeEnvelope(2, 1, 1, kAnnounce, Bytes{2})), "direct envelope is routed");
  Expect(router.Route(MakeEnvelope(2, 0, 1, kAnnounce, Bytes{2})), "broadcast envelope is routed");
  Expect(delivered == 2, "handler saw both envelopes");

  Envelope other_session = MakeEnvelope(2, 1, 1, kAnnounce, Bytes{2});
  other_session.session_id = Bytes{9, 9};
  Expect(!router.Route(other_session), "unknown session is dropped");
  Expect(!router.Route(MakeEnvelope(2, 3, 1, kAnnounce, Bytes{2})), "envelope for another party is dropped");
  Expect(!router.Route(MakeEnvelope(2, 1, 0, kAnnounce, Bytes{2})), "round 0 is dropped");
  Expect(router.rejected_count() == 3, "router counts rejected envelopes");

  router.UnregisterSession(kSessionId);
  Expect(!router.HasSession(kSessionId), "unregistered session is gone");
  ExpectThrow([]() { cggmp::SessionRouter bad(0); }, "router rejects party 0");
}

void TestInMemoryNetwork() {
  auto network = std::make_shared<cggmp::InMemoryNetwork>();
  auto a = network->CreateEndpoint(1);
  auto b = network->CreateEndpoint(2);
  auto c = network->CreateEndpoint(3);

  std::vector<Envelope> seen_a;
  std::vector<Envelope> seen_b;
  std::vector<Envelope> seen_c;
  a->RegisterHandler([&seen_a](const Envelope& e) { seen_a.push_back(e); });
  b->RegisterHandler([&seen_b](const Envelope& e) { seen_b.push_back(e); });
  c->RegisterHandler([&seen_c](const Envelope& e) { seen_c.push_back(e); });

  a->Broadcast(MakeEnvelope(1, 0, 1, kAnnounce, Bytes{1}));
  Expect(a->pending_count() == 0, "broadcast is not echoed to the sender");
  Expect(b->pending_count() == 1 && c->pending_count() == 1, "broadcast is queued at every peer");
  Expect(seen_b.empty(), "delivery waits for a pump");
  Expect(network->PumpAll() == 2, "PumpAll reports delivered envelopes");
  Expect(seen_b.size() == 1 && seen_c.size() == 1 && seen_a.empty(), "broadcast reached both peers");

  b->Send(3, MakeEnvelope(2, 0, 1, kReply, Bytes{20}));
  Expect(network->PumpAll() == 1, "direct send delivers one envelope");
  Expect(seen_c.size() == 2 && seen_c.back().to == 3, "direct send is addressed to its recipient");
  Expect(network->PumpAll() == 0, "nothing left in flight");

  ExpectThrow([&]() { a->Send(9, MakeEnvelope(1, 9, 1, kReply, Bytes{1})); }, "unknown recipient");
  ExpectThrow([&]() { a->Broadcast(MakeEnvelope(2, 0, 1, kAnnounce, Bytes{1})); },
              "sender must match the endpoint");
}

void TestFutureRoundBuffering() {
  CountingSession session(1, {1, 2});
  const std::vector<Envelope> first = session.Start();
  Expect(first.size() == 1 && first.front().to == cggmp::kBroadcastPartyId, "round 1 broadcasts once");
  Expect(first.front().round == 1, "outbound envelopes carry their round");

  const std::vector<Envelope> early = session.HandleEnvelope(MakeEnvelope(2, 1, 2, kReply, Bytes{20}));
  Expect(early.empty(), "a round 2 message does not advance round 1");
  Expect(session.current_round() == 1, "session still waits in round 1");
  Expect(session.sum() == 0, "buffered message is not validated early");

  const std::vector<Envelope> second = session.HandleEnvelope(MakeEnvelope(2, 0, 1, kAnnounce, Bytes{2}));
  Expect(second.size() == 1 && second.front().to == 2 && second.front().round == 2,
         "completing round 1 emits the round 2 direct message");
  Expect(session.status() == SessionStatus::kCompleted, "buffered round 2 message completes the run");
  Expect(session.sum() == 22 && session.finished_rounds() == 2, "both rounds were folded");

  Expect(session.HandleEnvelope(MakeEnvelope(2, 0, 1, kAnnounce, Bytes{2})).empty(),
         "a completed session ignores further input");
}

void TestDuplicatesAndRejections() {
  CountingSession session(1, {1, 2, 3});
  (void)session.Start();

  (void)session.HandleEnvelope(MakeEnvelope(2, 0, 1, kAnnounce, Bytes{2}));
  (void)session.HandleEnvelope(MakeEnvelope(2, 0, 1, kAnnounce, Bytes{2}));
  Expect(session.received_count_in_round() == 1, "duplicate message is stored once");
  Expect(session.sum() == 2, "duplicate message is validated once");

  Envelope wrong_session = MakeEnvelope(3, 0, 1, kAnnounce, Bytes{3});
  wrong_session.session_id = Bytes{1};
  (void)session.HandleEnvelope(wrong_session);
  (void)session.HandleEnvelope(MakeEnvelope(1, 0, 1, kAnnounce, Bytes{1}));
  (void)session.HandleEnvelope(MakeEnvelope(7, 0, 1, kAnnounce, Bytes{7}));
  (void)session.HandleEnvelope(MakeEnvelope(3, 0, 9, kAnnounce, Bytes{3}));
  (void)session.HandleEnvelope(MakeEnvelope(3, 2, 1, kAnnounce, Bytes{3}));
  Expect(session.rejected_count() == 5, "foreign, self, outsider, out-of-range and misaddressed envelopes");
  Expect(session.status() == SessionStatus::kRunning, "rejections do not abort");
  Expect(session.current_round() == 1, "round 1 still waits for party 3");
}

void TestAbortPaths() {
  {
    CountingSession session(1, {1, 2, 3});
    (void)session.Start();
    (void)session.HandleEnvelope(MakeEnvelope(3, 0, 1, 99, Bytes{3}));
    ExpectAbort(session, AbortReason::kUnexpectedMessage, 3, "unknown message type");
  }
  {
    CountingSession session(1, {1, 2, 3});
    (void)session.Start();
    (void)session.HandleEnvelope(MakeEnvelope(2, 1, 1, kAnnounce, Bytes{2}));
    ExpectAbort(session, AbortReason::kUnexpectedMessage, 2, "broadcast message sent directly");
  }
  {
    CountingSession session(1, {1, 2, 3});
    (void)session.Start();
    (void)session.HandleEnvelope(MakeEnvelope(2, 0, 1, kAnnounce, Bytes{2, 2}));
    ExpectAbort(session, AbortReason::kMalformedMessage, 2, "undecodable payload");
  }
  {
    CountingSession session(1, {1, 2, 3});
    (void)session.Start();
    (void)session.HandleEnvelope(MakeEnvelope(3, 0, 1, kAnnounce, Bytes{kPoison}));
    ExpectAbort(session, AbortReason::kInvalidDecommitment, 3, "attributable validation failure");
    try {
      session.RethrowIfAborted();
    } catch (const ProtocolAbort& abort) {
      Expect(std::string(abort.what()).find("blamed parties: 3") != std::string::npos,
             "abort message names the culprit");
    }
  }
  {
    // The poisoned message waits in the buffer and aborts once round 2 starts.
    CountingSession session(1, {1, 2});
    (void)session.Start();
    (void)session.HandleEnvelope(MakeEnvelope(2, 1, 2, kReply, Bytes{kPoison}));
    Expect(session.status() == SessionStatus::kRunning, "buffered message is not checked early");
    (void)session.HandleEnvelope(MakeEnvelope(2, 0, 1, kAnnounce, Bytes{2}));
    ExpectAbort(session, AbortReason::kInvalidDecommitment, 2, "buffered poisoned message");
  }
}

void TestLocalRoundFailure() {
  FailingFinishSession session(1, {1, 2}, /*crypto_failure=*/false);
  (void)session.Start();
  const auto out = session.HandleEnvelope(MakeEnvelope(2, cggmp::kBroadcastPartyId, 1, kAnnounce, Bytes{2}));
  Expect(out.empty(), "failed round emits nothing");
  Expect(session.status() == SessionStatus::kAborted, "local error in FinishRound aborts");
  Expect(session.abort_detail()->reason() == AbortReason::kLocalFailure, "local error is classified");
  Expect(session.abort_detail()->culprits().empty(), "local error blames nobody");
  Expect(session.HandleEnvelope(MakeEnvelope(2, 1, 2, kReply, Bytes{20})).empty(),
         "aborted session ignores later rounds");

  FailingFinishSession crypto(1, {1, 2}, /*crypto_failure=*/true);
  (void)crypto.Start();
  bool thrown = false;
  try {
    (void)crypto.HandleEnvelope(MakeEnvelope(2, cggmp::kBroadcastPartyId, 1, kAnnounce, Bytes{2}));
  } catch (const cggmp::CryptoFailure&) {
    thrown = true;
  }
  Expect(thrown, "CryptoFailure from FinishRound reaches the caller");
  Expect(crypto.status() != SessionStatus::kAborted, "CryptoFailure is not recorded as a protocol abort");
}

void TestTimeout() {
  CountingSession session(1, {1, 2, 3});
  (void)session.Start();
  (void)session.HandleEnvelope(MakeEnvelope(2, 0, 1, kAnnounce, Bytes{2}));

  Expect(!session.PollTimeout(), "fresh session has not timed out");
  Expect(session.PollTimeout(std::chrono::steady_clock::now() + std::chrono::hours(1)), "stale session times out");
  Expect(session.status() == SessionStatus::kTimedOut, "status is timed out");
  Expect(session.abort_detail().has_value() && session.abort_detail()->reason() == AbortReason::kTimedOut,
         "timeout is recorded as an abort");
  Expect(session.abort_detail()->culprits() == std::vector<PartyIndex>{3}, "timeout blames the silent party");
}

void TestInvalidConfiguration() {
  ExpectThrow([]() { CountingSession session(1, {1}); }, "one participant is not a protocol");
  ExpectThrow([]() { CountingSession session(1, {1, 1, 2}); }, "duplicate participants");
  ExpectThrow([]() { CountingSession session(4, {1, 2, 3}); }, "self must participate");
  ExpectThrow([]() { CountingSession session(1, {0, 1, 2}); }, "party id 0 is reserved");
}

void TestRunInMemory() {
  std::vector<std::unique_ptr<CountingSession>> sessions;
  std::vector<cggmp::RoundSession*> raw;
  for (PartyIndex id = 1; id <= 3; ++id) {
    sessions.push_back(std::make_unique<CountingSession>(id, std::vector<PartyIndex>{1, 2, 3}));
    raw.push_back(sessions.back().get());
  }
  cggmp::RunInMemory(raw);
  for (const auto& session : sessions) {
    Expect(session->status() == SessionStatus::kCompleted, "every session completes over the network");
  }
  // Party 1 hears 2 + 3 in round 1 and 20 + 30 in round 2.
  Expect(sessions[0]->sum() == 55, "party 1 folded every peer message");

  Expect(cggmp::DeriveSessionId("keygen", 1) != cggmp::DeriveSessionId("keygen", 2), "seed changes session id");
  Expect(cggmp::DeriveSessionId("keygen", 1) != cggmp::DeriveSessionId("sign", 1), "protocol changes session id");
}

void TestThreadPoolAndLogging() {
  cggmp::ThreadPool pool(3);
  const std::vector<int> inputs = {1, 2, 3, 4, 5, 6};
  const std::vector<int> squares = pool.Map(inputs, [](const int& v) { return v * v; });
  Expect(squares == std::vector<int>({1, 4, 9, 16, 25, 36}), "Map keeps input order");
  ExpectThrow([&]() {
    (void)pool.Map(inputs, [](const int& v) -> int {
      if (v == 4) {
        throw std::runtime_error("boom");
      }
      return v;
    });
  }, "Map rethrows a task failure");
  ExpectThrow([]() { cggmp::ThreadPool empty(0); }, "pool needs a worker");

  Expect(cggmp::ParseLogSeverity("debug") == boost::log::trivial::debug, "debug severity parses");
  Expect(!cggmp::ParseLogSeverity("loud").has_value(), "unknown severity is rejected");
  cggmp::InitLogging(cggmp::LogConfig::FromEnvironment());
}

}  // namespace

int main() {
  try {
    TestEnvelopeRoundTrip();
    TestSessionRouter();
    TestInMemoryNetwork();
    TestFutureRoundBuffering();
    TestDuplicatesAndRejections();
    TestAbortPaths();
    TestLocalRoundFailure();
    TestTimeout();
    TestInvalidConfiguration();
    TestRunInMemory();
    TestThreadPoolAndLogging();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Engine tests passed" << '\n';
  return 0;
}
