#include "cggmp/zk/schnorr.hpp"

#include "cggmp/common/secure_zeroize.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/random.hpp"

namespace cggmp {
namespace {

constexpr char kSchnorrProofId[] = "CGGMP21/Schnorr/v1";

Scalar BuildSchnorrChallenge(const ProofContext& ctx, const ECPoint& statement, const ECPoint& a) {
  Transcript transcript = StartProofTranscript(kSchnorrProofId, ctx);
  transcript.append_point("X", statement);
  transcript.append_point("A", a);
  return transcript.challenge_scalar_mod_q();
}

}  // namespace

SchnorrCommitment SchnorrCommit() {
  SchnorrCommitment out;
  out.alpha = Csprng::RandomNonZeroScalar();
  out.a = ECPoint::GeneratorMultiply(out.alpha);
  return out;
}

Scalar SchnorrRespond(const ProofContext& ctx,
                      const ECPoint& statement,
                      const SchnorrCommitment& commitment,
                      const Scalar& witness) {
  const Scalar e = BuildSchnorrChallenge(ctx, statement, commitment.a);
  return commitment.alpha + e * witness;
}

ProofCheck VerifySchnorrResponse(const ProofContext& ctx,
                                 const ECPoint& statement,
                                 const ECPoint& commitment,
                                 const Scalar& response) {
  if (commitment.IsInfinity()) {
    return ProofCheck::kMalformedStatement;
  }
  const Scalar e = BuildSchnorrChallenge(ctx, statement, commitment);
  const ECPoint lhs = ECPoint::GeneratorMultiply(response);
  const ECPoint rhs = commitment.Add(statement.Mul(e));
  return lhs == rhs ? ProofCheck::kOk : ProofCheck::kGroupRelation;
}

SchnorrProof ProveSchnorr(const ProofContext& ctx, const ECPoint& statement, const Scalar& witness) {
  SchnorrCommitment commitment = SchnorrCommit();
  ScopedZeroize<Scalar> wipe_alpha(&commitment.alpha);
  return SchnorrProof{
      .a = commitment.a,
      .z = SchnorrRespond(ctx, statement, commitment, witness),
  };
}

ProofCheck VerifySchnorr(const ProofContext& ctx, const ECPoint& statement, const SchnorrProof& proof) {
  return VerifySchnorrResponse(ctx, statement, proof.a, proof.z);
}

void AppendSchnorrProof(const SchnorrProof& proof, Bytes* out) {
  AppendPoint(proof.a, out);
  AppendScalar(proof.z, out);
}

SchnorrProof ReadSchnorrProof(std::span<const uint8_t> input, size_t* offset) {
  SchnorrProof out;
  out.a = ReadPoint(input, offset);
  out.z = ReadScalar(input, offset);
  return out;
}

}  // namespace cggmp
