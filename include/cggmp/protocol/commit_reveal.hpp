#pragma once

#include <cstddef>
#include <span>
#include <unordered_map>
#include <vector>

#include "cggmp/common/bytes.hpp"
#include "cggmp/protocol/types.hpp"

namespace cggmp {

// Length of the per-party random identifier rid_i and of chain code shares.
constexpr size_t kRidLen = 32;
constexpr size_t kCommitmentLen = 32;

// H(sid, V_1..V_n) in participant order, sent in the echo round.
Bytes EchoDigest(const Bytes& session_id,
                 const std::vector<PartyIndex>& participants,
                 const std::unordered_map<PartyIndex, Bytes>& commitments);

// acc ^= contribution; both must have the same length.
void XorInto(std::span<const uint8_t> contribution, Bytes* acc);

}  // namespace cggmp
