#pragma once

#include <cstdint>
#include <string_view>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/transcript.hpp"
#include "cggmp/protocol/types.hpp"

namespace cggmp {

// Binds a proof to one (session, prover, verifier, round) so it cannot be
// replayed elsewhere. verifier 0 marks a proof addressed to every party.
struct ProofContext {
  Bytes session_id;
  PartyIndex prover = 0;
  PartyIndex verifier = 0;
  uint32_t round = 0;
  // Extra binding material, e.g. the joint rid.
  Bytes tag;
};

enum class ProofCheck {
  kOk = 0,
  kRangeExceeded,
  kPaillierRelation,
  kPedersenRelation,
  kGroupRelation,
  kMalformedStatement,
  kModulusMalformed,
};

const char* ProofCheckName(ProofCheck check);

Transcript StartProofTranscript(std::string_view proof_id, const ProofContext& ctx);

}  // namespace cggmp
