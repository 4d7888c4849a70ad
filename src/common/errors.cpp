#include "cggmp/common/errors.hpp"

#include <utility>

namespace cggmp {
namespace {

std::string FormatAbort(AbortReason reason,
                        const std::vector<PartyIndex>& culprits,
                        const std::string& detail) {
  std::string out = std::string("protocol aborted (") + AbortReasonName(reason) + ")";
  if (!culprits.empty()) {
    out += ", blamed parties:";
    for (PartyIndex party : culprits) {
      out += " " + std::to_string(party);
    }
  }
  if (!detail.empty()) {
    out += ": " + detail;
  }
  return out;
}

}  // namespace

const char* AbortReasonName(AbortReason reason) {
  switch (reason) {
    case AbortReason::kUnexpectedMessage:
      return "unexpected message";
    case AbortReason::kMalformedMessage:
      return "malformed message";
    case AbortReason::kRound1NotReliable:
      return "round 1 broadcast not reliable";
    case AbortReason::kInvalidDecommitment:
      return "invalid decommitment";
    case AbortReason::kInvalidFeldmanCommitmentSize:
      return "invalid Feldman commitment size";
    case AbortReason::kInvalidSecretShare:
      return "invalid secret share";
    case AbortReason::kMissingChainCode:
      return "missing chain code";
    case AbortReason::kInvalidSchnorrProof:
      return "invalid Schnorr proof";
    case AbortReason::kInvalidPaillierModulus:
      return "invalid Paillier modulus";
    case AbortReason::kInvalidModProof:
      return "invalid Paillier-Blum modulus proof";
    case AbortReason::kInvalidPrmProof:
      return "invalid ring-Pedersen parameter proof";
    case AbortReason::kInvalidFacProof:
      return "invalid no-small-factor proof";
    case AbortReason::kInvalidEncProof:
      return "invalid encryption range proof";
    case AbortReason::kInvalidAffGProof:
      return "invalid affine operation proof";
    case AbortReason::kInvalidLogStarProof:
      return "invalid group commitment proof";
    case AbortReason::kMtaDecryptionOutOfRange:
      return "MtA decryption out of range";
    case AbortReason::kPresignDeltaMismatch:
      return "presignature delta mismatch";
    case AbortReason::kTimedOut:
      return "timed out";
    case AbortReason::kLocalFailure:
      return "local failure";
  }
  return "unknown";
}

ProtocolAbort::ProtocolAbort(AbortReason reason,
                             std::vector<PartyIndex> culprits,
                             const std::string& detail)
    : std::runtime_error(FormatAbort(reason, culprits, detail)),
      reason_(reason),
      culprits_(std::move(culprits)),
      detail_(detail) {}

AbortReason ProtocolAbort::reason() const {
  return reason_;
}

const std::vector<PartyIndex>& ProtocolAbort::culprits() const {
  return culprits_;
}

const std::string& ProtocolAbort::detail() const {
  return detail_;
}

}  // namespace cggmp
