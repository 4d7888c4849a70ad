#include "cggmp/zk/log_star.hpp"

#include "cggmp/common/secure_zeroize.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/bigint.hpp"

namespace cggmp {
namespace {

constexpr char kLogStarProofId[] = "CGGMP21/LogStar/v1";
constexpr int kMaxProveAttempts = 64;

mpz_class BuildChallenge(const ProofContext& ctx,
                         const SecurityLevel& level,
                         const LogStarStatement& statement,
                         const RingPedersenParams& params,
                         const LogStarProof& proof) {
  Transcript transcript = StartProofTranscript(kLogStarProofId, ctx);
  transcript.append_mpz("N0", statement.prover_key.n);
  transcript.append_mpz("C", statement.ciphertext);
  transcript.append_point("X", statement.x);
  transcript.append_point("g", statement.base);
  transcript.append_mpz("Nhat", params.n);
  transcript.append_mpz("s", params.s);
  transcript.append_mpz("t", params.t);
  transcript.append_mpz("S", proof.s);
  transcript.append_mpz("A", proof.a);
  transcript.append_point("Y", proof.y);
  transcript.append_mpz("D", proof.d);
  return transcript.challenge_signed(level.q);
}

}  // namespace

LogStarProof ProveLogStar(const ProofContext& ctx,
                          const SecurityLevel& level,
                          const LogStarStatement& statement,
                          const LogStarWitness& witness,
                          const RingPedersenParams& verifier_params) {
  const mpz_class& n0 = statement.prover_key.n;
  const mpz_class& n_hat = verifier_params.n;
  const mpz_class range = TwoPow(level.EllBits() + level.EpsilonBits());

  for (int attempt = 1;; ++attempt) {
    mpz_class alpha = RandomSignedRange(range);
    mpz_class mu = RandomSignedRange(TwoPow(level.EllBits()) * n_hat);
    mpz_class r = RandomZnStar(n0);
    mpz_class gamma = RandomSignedRange(range * n_hat);

    LogStarProof proof;
    proof.s = verifier_params.Commit(witness.x, mu);
    proof.a = statement.prover_key.Encrypt(alpha, r);
    proof.y = statement.base.Mul(Scalar(alpha));
    proof.d = verifier_params.Commit(alpha, gamma);

    const mpz_class e = BuildChallenge(ctx, level, statement, verifier_params, proof);
    proof.z1 = alpha + e * witness.x;
    proof.z2 = MulMod(r, PowModSigned(witness.rho, e, n0), n0);
    proof.z3 = gamma + e * mu;

    SecureZeroize(&alpha);
    SecureZeroize(&mu);
    SecureZeroize(&r);
    SecureZeroize(&gamma);

    if (IsInSignedRange(proof.z1, range) || attempt >= kMaxProveAttempts) {
      return proof;
    }
  }
}

ProofCheck VerifyLogStar(const ProofContext& ctx,
                         const SecurityLevel& level,
                         const LogStarStatement& statement,
                         const RingPedersenParams& verifier_params,
                         const LogStarProof& proof) {
  const PaillierPublicKey& key = statement.prover_key;
  const mpz_class& n_hat = verifier_params.n;
  if (!verifier_params.IsWellFormed() || !key.IsValidCiphertext(statement.ciphertext) ||
      statement.base.IsInfinity()) {
    return ProofCheck::kMalformedStatement;
  }
  if (!key.IsValidCiphertext(proof.a) || !IsZnStarElement(proof.z2, key.n) ||
      !IsZnStarElement(proof.s, n_hat) || !IsZnStarElement(proof.d, n_hat)) {
    return ProofCheck::kMalformedStatement;
  }
  if (!IsInSignedRange(proof.z1, TwoPow(level.EllBits() + level.EpsilonBits()))) {
    return ProofCheck::kRangeExceeded;
  }

  const mpz_class e = BuildChallenge(ctx, level, statement, verifier_params, proof);
  if (key.Encrypt(proof.z1, proof.z2) != key.Add(proof.a, key.Scale(statement.ciphertext, e))) {
    return ProofCheck::kPaillierRelation;
  }
  if (statement.base.Mul(Scalar(proof.z1)) != proof.y.Add(statement.x.Mul(Scalar(e)))) {
    return ProofCheck::kGroupRelation;
  }
  if (verifier_params.Commit(proof.z1, proof.z3) !=
      MulMod(proof.d, PowModSigned(proof.s, e, n_hat), n_hat)) {
    return ProofCheck::kPedersenRelation;
  }
  return ProofCheck::kOk;
}

void AppendLogStarProof(const LogStarProof& proof, Bytes* out) {
  AppendMpzField(proof.s, out);
  AppendMpzField(proof.a, out);
  AppendPoint(proof.y, out);
  AppendMpzField(proof.d, out);
  AppendSignedMpzField(proof.z1, out);
  AppendMpzField(proof.z2, out);
  AppendSignedMpzField(proof.z3, out);
}

LogStarProof ReadLogStarProof(std::span<const uint8_t> input, size_t* offset) {
  LogStarProof out;
  out.s = ReadMpzField(input, offset, kMaxMpzFieldLen, "log* proof S");
  out.a = ReadMpzField(input, offset, kMaxMpzFieldLen, "log* proof A");
  out.y = ReadPoint(input, offset);
  out.d = ReadMpzField(input, offset, kMaxMpzFieldLen, "log* proof D");
  out.z1 = ReadSignedMpzField(input, offset, kMaxMpzFieldLen, "log* proof z1");
  out.z2 = ReadMpzField(input, offset, kMaxMpzFieldLen, "log* proof z2");
  out.z3 = ReadSignedMpzField(input, offset, kMaxMpzFieldLen, "log* proof z3");
  return out;
}

}  // namespace cggmp
