#include "cggmp/protocol/runner.hpp"

#include <memory>
#include <numeric>
#include <string>
#include <unordered_set>
#include <utility>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include "cggmp/common/errors.hpp"
#include "cggmp/common/thread_pool.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/hash.hpp"
#include "cggmp/net/in_memory_transport.hpp"
#include "cggmp/protocol/hd_derivation.hpp"
#include "cggmp/protocol/keygen_session.hpp"
#include "cggmp/protocol/session_router.hpp"

namespace cggmp {
namespace {

constexpr char kSessionIdDomain[] = "CGGMP21/session-id/v1";

void ValidateRunParams(const RunParams& params) {
  if (params.n < 2) {
    throw LocalValidationError("a run needs at least 2 parties");
  }
  if (params.t.has_value() && (*params.t < 2 || *params.t > params.n)) {
    throw LocalValidationError("threshold must be within [2, n]");
  }
  params.level.Validate();
}

std::vector<PartyIndex> PartyIds(uint32_t n) {
  std::vector<PartyIndex> ids(n);
  std::iota(ids.begin(), ids.end(), PartyIndex{1});
  return ids;
}

const CoreKeyShare& CoreShareOf(const std::vector<CoreKeyShare>& shares, PartyIndex id) {
  for (const CoreKeyShare& share : shares) {
    if (share.i == id) {
      return share;
    }
  }
  throw LocalValidationError("no key share for party " + std::to_string(id));
}

const KeyShare& ShareOf(const std::vector<KeyShare>& shares, PartyIndex id) {
  for (const KeyShare& share : shares) {
    if (share.core.i == id) {
      return share;
    }
  }
  throw LocalValidationError("no key share for party " + std::to_string(id));
}

// Every local share must belong to the same key and to a distinct holder.
std::vector<PartyIndex> HoldersOf(const std::vector<CoreKeyShare>& shares) {
  if (shares.empty()) {
    throw LocalValidationError("no key shares given");
  }
  const KeyInfo& info = shares.front().key_info;
  const Bytes key_hash = HashKeyInfo(info);
  std::unordered_set<PartyIndex> seen;
  for (const CoreKeyShare& share : shares) {
    if (HashKeyInfo(share.key_info) != key_hash) {
      throw LocalValidationError("key shares belong to different keys");
    }
    if (!seen.insert(share.i).second) {
      throw LocalValidationError("duplicate key share for party " + std::to_string(share.i));
    }
  }
  if (seen.size() != info.participants.size()) {
    throw LocalValidationError("every holder of the key must take part");
  }
  return info.participants;
}

void ValidateSigners(const std::vector<KeyShare>& shares, const std::vector<PartyIndex>& signers) {
  if (signers.empty()) {
    throw LocalValidationError("signer set must not be empty");
  }
  std::unordered_set<PartyIndex> seen;
  for (PartyIndex signer : signers) {
    if (!seen.insert(signer).second) {
      throw LocalValidationError("signer set contains party " + std::to_string(signer) + " twice");
    }
    ShareOf(shares, signer).Validate();
  }

  const KeyInfo& info = ShareOf(shares, signers.front()).core.key_info;
  if (signers.size() < info.min_signers()) {
    throw LocalValidationError(str(boost::format("%1% signers cannot meet the threshold of %2%") %
                                   signers.size() % info.min_signers()));
  }
  if (signers.size() < 2) {
    throw LocalValidationError("signing runs between at least 2 parties");
  }
}

std::vector<std::shared_ptr<const PaillierProvider>> GeneratePaillierKeys(size_t count, unsigned long bits) {
  std::vector<size_t> slots(count);
  std::iota(slots.begin(), slots.end(), size_t{0});
  return ProofThreadPool().Map(slots, [bits](const size_t&) {
    return std::make_shared<const PaillierProvider>(bits);
  });
}

template <typename SessionT>
std::vector<RoundSession*> RawSessions(const std::vector<std::unique_ptr<SessionT>>& sessions) {
  std::vector<RoundSession*> out;
  out.reserve(sessions.size());
  for (const auto& session : sessions) {
    out.push_back(session.get());
  }
  return out;
}

void Dispatch(ITransport& transport, const std::vector<Envelope>& outbound) {
  for (const Envelope& envelope : outbound) {
    if (envelope.to == kBroadcastPartyId) {
      transport.Broadcast(envelope);
    } else {
      transport.Send(envelope.to, envelope);
    }
  }
}

std::vector<AuxInfoResult> RunAuxInfoSessions(const std::vector<CoreKeyShare>& shares,
                                              const RunParams& params,
                                              bool refresh) {
  params.level.Validate();
  const std::vector<PartyIndex> ids = HoldersOf(shares);
  const Bytes session_id = DeriveSessionId(refresh ? "key-refresh" : "aux-info", params.seed);
  const std::vector<std::shared_ptr<const PaillierProvider>> keys =
      GeneratePaillierKeys(ids.size(), params.level.paillier_bits);

  std::vector<std::unique_ptr<AuxInfoSession>> sessions;
  for (size_t k = 0; k < ids.size(); ++k) {
    const CoreKeyShare& share = CoreShareOf(shares, ids[k]);
    sessions.push_back(std::make_unique<AuxInfoSession>(AuxInfoSessionConfig{
        .session_id = session_id,
        .self_id = ids[k],
        .participants = ids,
        .level = params.level,
        .refresh_shares = refresh,
        .key_share = refresh ? std::optional<CoreKeyShare>(share) : std::nullopt,
        .enforce_reliable_broadcast = params.enforce_reliable_broadcast,
        .paillier = keys[k],
        .timeout = params.timeout,
    }));
  }
  RunInMemory(RawSessions(sessions));

  std::vector<AuxInfoResult> out;
  for (const auto& session : sessions) {
    out.push_back(session->result());
  }
  return out;
}

}  // namespace

Bytes DeriveSessionId(std::string_view protocol, uint64_t seed) {
  Bytes preimage;
  AppendSizedField(AsByteSpan(kSessionIdDomain), &preimage);
  AppendSizedField(AsByteSpan(protocol), &preimage);
  AppendU32Be(static_cast<uint32_t>(seed >> 32), &preimage);
  AppendU32Be(static_cast<uint32_t>(seed), &preimage);
  return Sha256(preimage);
}

void RunInMemory(const std::vector<RoundSession*>& sessions) {
  if (sessions.empty()) {
    throw LocalValidationError("no sessions to run");
  }

  struct LocalParty {
    RoundSession* session = nullptr;
    std::shared_ptr<InMemoryTransport> transport;
    std::unique_ptr<SessionRouter> router;
  };

  auto network = std::make_shared<InMemoryNetwork>();
  std::vector<LocalParty> parties;
  parties.reserve(sessions.size());
  for (RoundSession* session : sessions) {
    LocalParty party;
    party.session = session;
    party.transport = network->CreateEndpoint(session->self_id());
    party.router = std::make_unique<SessionRouter>(session->self_id());
    parties.push_back(std::move(party));
  }

  for (LocalParty& party : parties) {
    RoundSession* session = party.session;
    InMemoryTransport* transport = party.transport.get();
    SessionRouter* router = party.router.get();
    router->RegisterSession(session->session_id(), [session, transport](const Envelope& envelope) {
      Dispatch(*transport, session->HandleEnvelope(envelope));
    });
    transport->RegisterHandler([router](const Envelope& envelope) {
      if (!router->Route(envelope)) {
        BOOST_LOG_TRIVIAL(debug) << str(boost::format("party %1%: router dropped envelope from %2%") %
                                        envelope.to % envelope.from);
      }
    });
  }

  for (LocalParty& party : parties) {
    Dispatch(*party.transport, party.session->Start());
  }

  while (true) {
    bool all_done = true;
    for (const LocalParty& party : parties) {
      party.session->RethrowIfAborted();
      if (!party.session->IsTerminal()) {
        all_done = false;
      }
    }
    if (all_done) {
      return;
    }

    if (network->PumpAll() == 0) {
      for (const LocalParty& party : parties) {
        if (party.session->PollTimeout()) {
          party.session->RethrowIfAborted();
        }
      }
      throw TransportError("in-memory run stalled with no messages in flight");
    }
  }
}

std::vector<CoreKeyShare> RunKeygen(const RunParams& params) {
  ValidateRunParams(params);
  const std::vector<PartyIndex> ids = PartyIds(params.n);
  const Bytes session_id = DeriveSessionId("keygen", params.seed);

  std::vector<std::unique_ptr<KeygenSession>> sessions;
  for (PartyIndex id : ids) {
    sessions.push_back(std::make_unique<KeygenSession>(KeygenSessionConfig{
        .session_id = session_id,
        .self_id = id,
        .participants = ids,
        .threshold = params.t,
        .hd_enabled = params.hd_enabled,
        .enforce_reliable_broadcast = params.enforce_reliable_broadcast,
        .timeout = params.timeout,
    }));
  }
  RunInMemory(RawSessions(sessions));

  std::vector<CoreKeyShare> out;
  for (const auto& session : sessions) {
    out.push_back(session->result());
  }
  return out;
}

std::vector<AuxInfo> RunAuxInfo(const std::vector<CoreKeyShare>& shares, const RunParams& params) {
  std::vector<AuxInfo> out;
  for (AuxInfoResult& result : RunAuxInfoSessions(shares, params, false)) {
    out.push_back(std::move(result.aux_info));
  }
  return out;
}

std::vector<KeyShare> RunDkg(const RunParams& params) {
  std::vector<CoreKeyShare> cores = RunKeygen(params);
  std::vector<AuxInfo> aux = RunAuxInfo(cores, params);

  std::vector<KeyShare> out;
  for (size_t k = 0; k < cores.size(); ++k) {
    KeyShare share{.core = std::move(cores[k]), .aux = std::move(aux[k])};
    share.Validate();
    out.push_back(std::move(share));
  }
  return out;
}

std::vector<KeyShare> RunRefresh(const std::vector<KeyShare>& shares, const RunParams& params) {
  std::vector<CoreKeyShare> cores;
  for (const KeyShare& share : shares) {
    cores.push_back(share.core);
  }

  std::vector<KeyShare> out;
  for (AuxInfoResult& result : RunAuxInfoSessions(cores, params, true)) {
    KeyShare share{.core = std::move(*result.refreshed_share), .aux = std::move(result.aux_info)};
    share.Validate();
    out.push_back(std::move(share));
  }
  return out;
}

std::vector<Presignature> RunPresign(const std::vector<KeyShare>& shares,
                                     const std::vector<PartyIndex>& signers,
                                     const RunParams& params) {
  ValidateSigners(shares, signers);
  params.level.Validate();
  const Bytes session_id = DeriveSessionId("presign", params.seed);

  std::vector<std::unique_ptr<PresignSession>> sessions;
  for (PartyIndex id : signers) {
    sessions.push_back(std::make_unique<PresignSession>(PresignSessionConfig{
        .session_id = session_id,
        .self_id = id,
        .signers = signers,
        .level = params.level,
        .key_share = ShareOf(shares, id),
        .timeout = params.timeout,
    }));
  }
  RunInMemory(RawSessions(sessions));

  std::vector<Presignature> out;
  for (const auto& session : sessions) {
    out.push_back(session->TakeResult());
  }
  return out;
}

Signature RunSignWithPresignatures(const std::vector<KeyShare>& shares,
                                   std::vector<Presignature> presignatures,
                                   std::span<const uint8_t> message_hash,
                                   const RunParams& params,
                                   const std::vector<uint32_t>& derivation_path) {
  if (presignatures.empty()) {
    throw LocalValidationError("signing requires presignatures");
  }
  const Bytes session_id = DeriveSessionId("sign", params.seed);

  std::vector<std::unique_ptr<SignSession>> sessions;
  for (Presignature& presignature : presignatures) {
    const PartyIndex owner = presignature.owner();
    sessions.push_back(std::make_unique<SignSession>(SignSessionConfig{
        .session_id = session_id,
        .self_id = owner,
        .key_share = ShareOf(shares, owner).core,
        .presignature = std::move(presignature),
        .message_hash = Bytes(message_hash.begin(), message_hash.end()),
        .derivation_path = derivation_path,
        .timeout = params.timeout,
    }));
  }
  RunInMemory(RawSessions(sessions));

  const Signature& first = sessions.front()->result();
  for (const auto& session : sessions) {
    if (session->result().r != first.r || session->result().s != first.s) {
      throw CryptoFailure("signers disagree on the combined signature");
    }
  }
  return first;
}

Signature RunSign(const std::vector<KeyShare>& shares,
                  const std::vector<PartyIndex>& signers,
                  std::span<const uint8_t> message_hash,
                  const RunParams& params,
                  const std::vector<uint32_t>& derivation_path) {
  ValidateSigners(shares, signers);
  if (message_hash.size() != 32) {
    throw LocalValidationError("message hash must be 32 bytes");
  }
  if (!derivation_path.empty()) {
    // Rejects hardened paths and keys without a chain code up front.
    (void)DeriveAdditiveShift(ShareOf(shares, signers.front()).core.key_info, derivation_path);
  }

  std::vector<Presignature> presignatures = RunPresign(shares, signers, params);
  return RunSignWithPresignatures(shares, std::move(presignatures), message_hash, params, derivation_path);
}

}  // namespace cggmp
