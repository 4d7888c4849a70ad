#include "cggmp/crypto/commitment.hpp"

#include <algorithm>

#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/hash.hpp"
#include "cggmp/crypto/random.hpp"

namespace cggmp {
namespace {

constexpr char kCommitPrefix[] = "CGGMP21/commit/v1";

Bytes BuildCommitPreimage(const std::string& domain,
                          std::span<const uint8_t> message,
                          std::span<const uint8_t> randomness) {
  Bytes preimage;
  preimage.reserve(sizeof(kCommitPrefix) - 1 + domain.size() + message.size() + randomness.size() + 16);

  AppendSizedField(AsByteSpan(kCommitPrefix), &preimage);
  AppendSizedField(AsByteSpan(domain), &preimage);
  AppendSizedField(message, &preimage);
  AppendSizedField(randomness, &preimage);
  return preimage;
}

}  // namespace

CommitmentResult CommitMessage(const std::string& domain,
                               std::span<const uint8_t> message,
                               size_t randomness_len) {
  CommitmentResult out;
  out.randomness = Csprng::RandomBytes(randomness_len);
  out.commitment = ComputeCommitment(domain, message, out.randomness);
  return out;
}

Bytes ComputeCommitment(const std::string& domain,
                        std::span<const uint8_t> message,
                        std::span<const uint8_t> randomness) {
  const Bytes preimage = BuildCommitPreimage(domain, message, randomness);
  return Sha256(preimage);
}

bool VerifyCommitment(const std::string& domain,
                      std::span<const uint8_t> message,
                      std::span<const uint8_t> randomness,
                      std::span<const uint8_t> commitment) {
  const Bytes expected = ComputeCommitment(domain, message, randomness);
  return std::equal(expected.begin(), expected.end(), commitment.begin(), commitment.end());
}

}  // namespace cggmp
