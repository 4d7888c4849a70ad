#include "cggmp/zk/no_small_factor.hpp"

#include <stdexcept>

#include "cggmp/common/secure_zeroize.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/bigint.hpp"

namespace cggmp {
namespace {

constexpr char kNoSmallFactorProofId[] = "CGGMP21/NoSmallFactor/v1";
constexpr int kMaxProveAttempts = 64;

mpz_class FloorSqrt(const mpz_class& value) {
  mpz_class out;
  mpz_sqrt(out.get_mpz_t(), value.get_mpz_t());
  return out;
}

mpz_class BuildChallenge(const ProofContext& ctx,
                         const SecurityLevel& level,
                         const mpz_class& n0,
                         const RingPedersenParams& params,
                         const NoSmallFactorProof& proof) {
  Transcript transcript = StartProofTranscript(kNoSmallFactorProofId, ctx);
  transcript.append_mpz("N0", n0);
  transcript.append_mpz("Nhat", params.n);
  transcript.append_mpz("s", params.s);
  transcript.append_mpz("t", params.t);
  transcript.append_mpz("P", proof.p_commit);
  transcript.append_mpz("Q", proof.q_commit);
  transcript.append_mpz("A", proof.a);
  transcript.append_mpz("B", proof.b);
  transcript.append_mpz("T", proof.t);
  transcript.append_signed_mpz("sigma", proof.sigma);
  return transcript.challenge_signed(level.q);
}

mpz_class ResponseBound(const SecurityLevel& level, const mpz_class& n0) {
  return FloorSqrt(n0) * TwoPow(level.ell + level.EpsilonBits());
}

}  // namespace

NoSmallFactorProof ProveNoSmallFactor(const ProofContext& ctx,
                                      const SecurityLevel& level,
                                      const mpz_class& n0,
                                      const mpz_class& p,
                                      const mpz_class& q,
                                      const RingPedersenParams& verifier_params) {
  if (p * q != n0) {
    throw std::invalid_argument("no-small-factor witness does not factor N0");
  }

  const mpz_class& n_hat = verifier_params.n;
  const mpz_class sqrt_n0 = FloorSqrt(n0);
  const mpz_class ell_scale = TwoPow(level.ell);
  const mpz_class ell_eps_scale = TwoPow(level.ell + level.EpsilonBits());
  const mpz_class bound = ResponseBound(level, n0);

  for (int attempt = 1;; ++attempt) {
    mpz_class alpha = RandomSignedRange(ell_eps_scale * sqrt_n0);
    mpz_class beta = RandomSignedRange(ell_eps_scale * sqrt_n0);
    mpz_class mu = RandomSignedRange(ell_scale * n_hat);
    mpz_class nu = RandomSignedRange(ell_scale * n_hat);
    mpz_class r = RandomSignedRange(ell_eps_scale * n0 * n_hat);
    mpz_class x = RandomSignedRange(ell_eps_scale * n_hat);
    mpz_class y = RandomSignedRange(ell_eps_scale * n_hat);

    NoSmallFactorProof proof;
    proof.sigma = RandomSignedRange(ell_scale * n0 * n_hat);
    proof.p_commit = verifier_params.Commit(p, mu);
    proof.q_commit = verifier_params.Commit(q, nu);
    proof.a = verifier_params.Commit(alpha, x);
    proof.b = verifier_params.Commit(beta, y);
    proof.t = MulMod(PowModSigned(proof.q_commit, alpha, n_hat),
                     PowModSigned(verifier_params.t, r, n_hat),
                     n_hat);

    const mpz_class e = BuildChallenge(ctx, level, n0, verifier_params, proof);
    const mpz_class sigma_hat = proof.sigma - nu * p;
    proof.z1 = alpha + e * p;
    proof.z2 = beta + e * q;
    proof.w1 = x + e * mu;
    proof.w2 = y + e * nu;
    proof.v = r + e * sigma_hat;

    SecureZeroize(&alpha);
    SecureZeroize(&beta);
    SecureZeroize(&mu);
    SecureZeroize(&nu);
    SecureZeroize(&r);
    SecureZeroize(&x);
    SecureZeroize(&y);

    // An out-of-range witness never converges; hand back a proof the verifier rejects.
    const bool in_range = IsInSignedRange(proof.z1, bound) && IsInSignedRange(proof.z2, bound);
    if (in_range || attempt >= kMaxProveAttempts) {
      return proof;
    }
  }
}

ProofCheck VerifyNoSmallFactor(const ProofContext& ctx,
                               const SecurityLevel& level,
                               const mpz_class& n0,
                               const RingPedersenParams& verifier_params,
                               const NoSmallFactorProof& proof) {
  const mpz_class& n_hat = verifier_params.n;
  if (!verifier_params.IsWellFormed() || n0 <= 3) {
    return ProofCheck::kMalformedStatement;
  }
  if (!IsZnStarElement(proof.p_commit, n_hat) || !IsZnStarElement(proof.q_commit, n_hat) ||
      !IsZnStarElement(proof.a, n_hat) || !IsZnStarElement(proof.b, n_hat) ||
      !IsZnStarElement(proof.t, n_hat)) {
    return ProofCheck::kMalformedStatement;
  }

  const mpz_class bound = ResponseBound(level, n0);
  if (!IsInSignedRange(proof.z1, bound) || !IsInSignedRange(proof.z2, bound)) {
    return ProofCheck::kRangeExceeded;
  }

  const mpz_class e = BuildChallenge(ctx, level, n0, verifier_params, proof);
  const mpz_class r_commit = verifier_params.Commit(n0, proof.sigma);

  if (verifier_params.Commit(proof.z1, proof.w1) !=
      MulMod(proof.a, PowModSigned(proof.p_commit, e, n_hat), n_hat)) {
    return ProofCheck::kPedersenRelation;
  }
  if (verifier_params.Commit(proof.z2, proof.w2) !=
      MulMod(proof.b, PowModSigned(proof.q_commit, e, n_hat), n_hat)) {
    return ProofCheck::kPedersenRelation;
  }
  const mpz_class lhs = MulMod(PowModSigned(proof.q_commit, proof.z1, n_hat),
                               PowModSigned(verifier_params.t, proof.v, n_hat),
                               n_hat);
  if (lhs != MulMod(proof.t, PowModSigned(r_commit, e, n_hat), n_hat)) {
    return ProofCheck::kPedersenRelation;
  }
  return ProofCheck::kOk;
}

void AppendNoSmallFactorProof(const NoSmallFactorProof& proof, Bytes* out) {
  AppendMpzField(proof.p_commit, out);
  AppendMpzField(proof.q_commit, out);
  AppendMpzField(proof.a, out);
  AppendMpzField(proof.b, out);
  AppendMpzField(proof.t, out);
  AppendSignedMpzField(proof.sigma, out);
  AppendSignedMpzField(proof.z1, out);
  AppendSignedMpzField(proof.z2, out);
  AppendSignedMpzField(proof.w1, out);
  AppendSignedMpzField(proof.w2, out);
  AppendSignedMpzField(proof.v, out);
}

NoSmallFactorProof ReadNoSmallFactorProof(std::span<const uint8_t> input, size_t* offset) {
  NoSmallFactorProof out;
  out.p_commit = ReadMpzField(input, offset, kMaxMpzFieldLen, "fac proof P");
  out.q_commit = ReadMpzField(input, offset, kMaxMpzFieldLen, "fac proof Q");
  out.a = ReadMpzField(input, offset, kMaxMpzFieldLen, "fac proof A");
  out.b = ReadMpzField(input, offset, kMaxMpzFieldLen, "fac proof B");
  out.t = ReadMpzField(input, offset, kMaxMpzFieldLen, "fac proof T");
  out.sigma = ReadSignedMpzField(input, offset, kMaxMpzFieldLen, "fac proof sigma");
  out.z1 = ReadSignedMpzField(input, offset, kMaxMpzFieldLen, "fac proof z1");
  out.z2 = ReadSignedMpzField(input, offset, kMaxMpzFieldLen, "fac proof z2");
  out.w1 = ReadSignedMpzField(input, offset, kMaxMpzFieldLen, "fac proof w1");
  out.w2 = ReadSignedMpzField(input, offset, kMaxMpzFieldLen, "fac proof w2");
  out.v = ReadSignedMpzField(input, offset, kMaxMpzFieldLen, "fac proof v");
  return out;
}

}  // namespace cggmp
