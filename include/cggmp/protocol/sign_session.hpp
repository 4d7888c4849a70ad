#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "cggmp/crypto/ec_point.hpp"
#include "cggmp/crypto/scalar.hpp"
#include "cggmp/protocol/key_share.hpp"
#include "cggmp/protocol/presign_session.hpp"
#include "cggmp/protocol/round_session.hpp"

namespace cggmp {

enum class SignMessageType : uint32_t {
  kPartial = 4001,
};

struct Signature {
  Scalar r;
  Scalar s;

  // r || s, 32 bytes each.
  std::array<uint8_t, 64> ToCompact() const;
};

// libsecp256k1 verification; high-s signatures are rejected.
bool VerifySignature(const ECPoint& public_key, std::span<const uint8_t> msg32, const Signature& signature);

struct SignSessionConfig {
  Bytes session_id;
  PartyIndex self_id = 0;
  CoreKeyShare key_share;
  std::optional<Presignature> presignature;
  Bytes message_hash;
  // Non-hardened BIP-32 path; empty signs under the shared public key.
  std::vector<uint32_t> derivation_path;
  std::chrono::milliseconds timeout = std::chrono::seconds(30);
};

// Completes a presignature: one broadcast of sigma_i, then s = sum sigma_j.
class SignSession : public RoundSession {
 public:
  explicit SignSession(SignSessionConfig cfg);
  ~SignSession() override;

  const ECPoint& public_key() const;

  bool HasResult() const;
  const Signature& result() const;

 protected:
  uint32_t round_count() const override;
  const char* protocol_name() const override;
  std::vector<RoundMessageSpec> ExpectedMessages(uint32_t round) const override;
  std::vector<Envelope> BeginRound(uint32_t round) override;
  void ValidateMessage(uint32_t round, const Envelope& envelope) override;
  void FinishRound(uint32_t round) override;

 private:
  Bytes message_hash_;
  ECPoint public_key_;
  Scalar shift_;
  ECPoint r_point_;
  Scalar r_;
  PresignatureSecrets secrets_;

  std::unordered_map<PartyIndex, Scalar> partials_;
  std::optional<Signature> result_;
};

}  // namespace cggmp
