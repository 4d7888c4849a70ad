#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "cggmp/crypto/security_level.hpp"
#include "cggmp/protocol/aux_info_session.hpp"
#include "cggmp/protocol/key_share.hpp"
#include "cggmp/protocol/presign_session.hpp"
#include "cggmp/protocol/round_session.hpp"
#include "cggmp/protocol/sign_session.hpp"

namespace cggmp {

// Shape of one in-process execution. Party ids are 1..n.
struct RunParams {
  uint32_t n = 3;
  // Unset runs the n-of-n variant.
  std::optional<uint32_t> t;
  SecurityLevel level = SecurityLevel::ReasonablySecure();
  bool hd_enabled = false;
  bool enforce_reliable_broadcast = true;
  // Seeds the session id of every run started with these params.
  uint64_t seed = 0;
  std::chrono::milliseconds timeout = std::chrono::seconds(120);
};

// Session id for one protocol run, derived from the execution seed.
Bytes DeriveSessionId(std::string_view protocol, uint64_t seed);

// Pumps the sessions over a fresh InMemoryNetwork until each one completes.
// Rethrows the first recorded ProtocolAbort; a run that stops making progress
// without aborting raises TransportError.
void RunInMemory(const std::vector<RoundSession*>& sessions);

std::vector<CoreKeyShare> RunKeygen(const RunParams& params);
std::vector<AuxInfo> RunAuxInfo(const std::vector<CoreKeyShare>& shares, const RunParams& params);
// Keygen followed by aux-info generation.
std::vector<KeyShare> RunDkg(const RunParams& params);
// New Paillier keys and a re-randomised sharing of the same public key.
std::vector<KeyShare> RunRefresh(const std::vector<KeyShare>& shares, const RunParams& params);

std::vector<Presignature> RunPresign(const std::vector<KeyShare>& shares,
                                     const std::vector<PartyIndex>& signers,
                                     const RunParams& params);
// Consumes one presignature per signer.
Signature RunSignWithPresignatures(const std::vector<KeyShare>& shares,
                                   std::vector<Presignature> presignatures,
                                   std::span<const uint8_t> message_hash,
                                   const RunParams& params,
                                   const std::vector<uint32_t>& derivation_path = {});
// Presigning followed by signing. Throws LocalValidationError before any
// message is sent when the signer set cannot meet the threshold.
Signature RunSign(const std::vector<KeyShare>& shares,
                  const std::vector<PartyIndex>& signers,
                  std::span<const uint8_t> message_hash,
                  const RunParams& params,
                  const std::vector<uint32_t>& derivation_path = {});

}  // namespace cggmp
