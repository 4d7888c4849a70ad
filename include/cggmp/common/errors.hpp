#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "cggmp/protocol/types.hpp"

namespace cggmp {

enum class AbortReason : uint32_t {
  kUnexpectedMessage = 1,
  kMalformedMessage = 2,
  kRound1NotReliable = 3,
  kInvalidDecommitment = 4,
  kInvalidFeldmanCommitmentSize = 5,
  kInvalidSecretShare = 6,
  kMissingChainCode = 7,
  kInvalidSchnorrProof = 8,
  kInvalidPaillierModulus = 9,
  kInvalidModProof = 10,
  kInvalidPrmProof = 11,
  kInvalidFacProof = 12,
  kInvalidEncProof = 13,
  kInvalidAffGProof = 14,
  kInvalidLogStarProof = 15,
  kMtaDecryptionOutOfRange = 16,
  kPresignDeltaMismatch = 17,
  kTimedOut = 18,
  // Local round logic failed outside message validation; nobody is blamed.
  kLocalFailure = 19,
};

const char* AbortReasonName(AbortReason reason);

// A remote party misbehaved; culprits names the blamed senders.
class ProtocolAbort : public std::runtime_error {
 public:
  ProtocolAbort(AbortReason reason, std::vector<PartyIndex> culprits, const std::string& detail);

  AbortReason reason() const;
  const std::vector<PartyIndex>& culprits() const;
  const std::string& detail() const;

 private:
  AbortReason reason_;
  std::vector<PartyIndex> culprits_;
  std::string detail_;
};

class LocalValidationError : public std::invalid_argument {
 public:
  explicit LocalValidationError(const std::string& what) : std::invalid_argument(what) {}
};

class CryptoFailure : public std::runtime_error {
 public:
  explicit CryptoFailure(const std::string& what) : std::runtime_error(what) {}
};

class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace cggmp
