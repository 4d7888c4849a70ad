#pragma once

#include <span>
#include <string>

#include "cggmp/common/bytes.hpp"

namespace cggmp {

struct CommitmentResult {
  Bytes commitment;
  Bytes randomness;
};

// Hash commitment H(prefix, domain, message, randomness).
CommitmentResult CommitMessage(const std::string& domain,
                               std::span<const uint8_t> message,
                               size_t randomness_len = 32);

Bytes ComputeCommitment(const std::string& domain,
                        std::span<const uint8_t> message,
                        std::span<const uint8_t> randomness);

bool VerifyCommitment(const std::string& domain,
                      std::span<const uint8_t> message,
                      std::span<const uint8_t> randomness,
                      std::span<const uint8_t> commitment);

}  // namespace cggmp
