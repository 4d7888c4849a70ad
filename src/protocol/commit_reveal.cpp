#include "cggmp/protocol/commit_reveal.hpp"

#include <stdexcept>

#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/hash.hpp"

namespace cggmp {
namespace {

constexpr char kEchoDomain[] = "CGGMP21/echo/v1";

}  // namespace

Bytes EchoDigest(const Bytes& session_id,
                 const std::vector<PartyIndex>& participants,
                 const std::unordered_map<PartyIndex, Bytes>& commitments) {
  Bytes preimage;
  AppendSizedField(AsByteSpan(kEchoDomain), &preimage);
  AppendSizedField(session_id, &preimage);
  for (PartyIndex id : participants) {
    const auto it = commitments.find(id);
    if (it == commitments.end()) {
      throw std::invalid_argument("echo digest is missing a commitment");
    }
    AppendU32Be(id, &preimage);
    AppendSizedField(it->second, &preimage);
  }
  return Sha256(preimage);
}

void XorInto(std::span<const uint8_t> contribution, Bytes* acc) {
  if (contribution.size() != acc->size()) {
    throw std::invalid_argument("xor operands differ in length");
  }
  for (size_t i = 0; i < contribution.size(); ++i) {
    (*acc)[i] ^= contribution[i];
  }
}

}  // namespace cggmp
