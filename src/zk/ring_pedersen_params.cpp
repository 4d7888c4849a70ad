#include "cggmp/zk/ring_pedersen_params.hpp"

#include <stdexcept>

#include "cggmp/common/secure_zeroize.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/bigint.hpp"

namespace cggmp {
namespace {

constexpr char kRingPedersenProofId[] = "CGGMP21/RingPedersenParams/v1";
constexpr uint32_t kMaxRepetitions = 1024;

std::vector<uint8_t> BuildChallengeBits(const ProofContext& ctx,
                                        const RingPedersenParams& params,
                                        const std::vector<mpz_class>& commitments) {
  Transcript transcript = StartProofTranscript(kRingPedersenProofId, ctx);
  transcript.append_mpz("N", params.n);
  transcript.append_mpz("s", params.s);
  transcript.append_mpz("t", params.t);
  for (const mpz_class& a : commitments) {
    transcript.append_mpz("A", a);
  }
  return transcript.challenge_bits(commitments.size());
}

}  // namespace

RingPedersenParamProof ProveRingPedersenParams(const ProofContext& ctx,
                                               const RingPedersenParams& params,
                                               const RingPedersenWitness& witness,
                                               uint32_t repetitions) {
  std::vector<mpz_class> nonces;
  nonces.reserve(repetitions);

  RingPedersenParamProof proof;
  proof.commitments.reserve(repetitions);
  for (uint32_t i = 0; i < repetitions; ++i) {
    nonces.push_back(RandomBelow(witness.phi));
    proof.commitments.push_back(PowMod(params.s, nonces.back(), params.n));
  }

  const std::vector<uint8_t> bits = BuildChallengeBits(ctx, params, proof.commitments);
  proof.responses.reserve(repetitions);
  for (uint32_t i = 0; i < repetitions; ++i) {
    mpz_class z = nonces[i];
    if (bits[i] != 0) {
      z += witness.lambda;
    }
    proof.responses.push_back(NormalizeMod(z, witness.phi));
    SecureZeroize(&nonces[i]);
  }
  return proof;
}

ProofCheck VerifyRingPedersenParams(const ProofContext& ctx,
                                    const RingPedersenParams& params,
                                    const RingPedersenParamProof& proof,
                                    uint32_t repetitions) {
  if (!params.IsWellFormed()) {
    return ProofCheck::kModulusMalformed;
  }
  if (proof.commitments.size() != repetitions || proof.responses.size() != repetitions) {
    return ProofCheck::kMalformedStatement;
  }

  const std::vector<uint8_t> bits = BuildChallengeBits(ctx, params, proof.commitments);
  for (uint32_t i = 0; i < repetitions; ++i) {
    const mpz_class& a = proof.commitments[i];
    const mpz_class& z = proof.responses[i];
    if (!IsZnStarElement(a, params.n) || z < 0 || z >= params.n) {
      return ProofCheck::kMalformedStatement;
    }

    mpz_class rhs = a;
    if (bits[i] != 0) {
      rhs = MulMod(rhs, params.t, params.n);
    }
    if (PowMod(params.s, z, params.n) != rhs) {
      return ProofCheck::kPedersenRelation;
    }
  }
  return ProofCheck::kOk;
}

void AppendRingPedersenParamProof(const RingPedersenParamProof& proof, Bytes* out) {
  if (proof.commitments.size() != proof.responses.size()) {
    throw std::invalid_argument("prm proof commitment and response counts differ");
  }
  AppendU32Be(static_cast<uint32_t>(proof.commitments.size()), out);
  for (size_t i = 0; i < proof.commitments.size(); ++i) {
    AppendMpzField(proof.commitments[i], out);
    AppendMpzField(proof.responses[i], out);
  }
}

RingPedersenParamProof ReadRingPedersenParamProof(std::span<const uint8_t> input, size_t* offset) {
  const uint32_t count = ReadU32Be(input, offset);
  if (count > kMaxRepetitions) {
    throw std::invalid_argument("prm proof has too many rounds");
  }

  RingPedersenParamProof out;
  out.commitments.reserve(count);
  out.responses.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    out.commitments.push_back(ReadMpzField(input, offset, kMaxMpzFieldLen, "prm proof A"));
    out.responses.push_back(ReadMpzField(input, offset, kMaxMpzFieldLen, "prm proof z"));
  }
  return out;
}

}  // namespace cggmp
