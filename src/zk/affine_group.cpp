#include "cggmp/zk/affine_group.hpp"

#include "cggmp/common/secure_zeroize.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/bigint.hpp"

namespace cggmp {
namespace {

constexpr char kAffineGroupProofId[] = "CGGMP21/AffineGroup/v1";
constexpr int kMaxProveAttempts = 64;

mpz_class BuildChallenge(const ProofContext& ctx,
                         const SecurityLevel& level,
                         const AffineGroupStatement& statement,
                         const RingPedersenParams& params,
                         const AffineGroupProof& proof) {
  Transcript transcript = StartProofTranscript(kAffineGroupProofId, ctx);
  transcript.append_mpz("N0", statement.receiver_key.n);
  transcript.append_mpz("N1", statement.prover_key.n);
  transcript.append_mpz("C", statement.c);
  transcript.append_mpz("D", statement.d);
  transcript.append_mpz("Y", statement.y);
  transcript.append_point("X", statement.x);
  transcript.append_mpz("Nhat", params.n);
  transcript.append_mpz("s", params.s);
  transcript.append_mpz("t", params.t);
  transcript.append_mpz("A", proof.a);
  transcript.append_point("Bx", proof.b_x);
  transcript.append_mpz("By", proof.b_y);
  transcript.append_mpz("E", proof.e_commit);
  transcript.append_mpz("S", proof.s);
  transcript.append_mpz("F", proof.f);
  transcript.append_mpz("T", proof.t);
  return transcript.challenge_signed(level.q);
}

// C^x (1 + N0)^y r^N0 mod N0^2
mpz_class AffineCombine(const PaillierPublicKey& key,
                        const mpz_class& c,
                        const mpz_class& x,
                        const mpz_class& y,
                        const mpz_class& r) {
  return key.Add(key.Scale(c, x), key.Encrypt(y, r));
}

}  // namespace

AffineGroupProof ProveAffineGroup(const ProofContext& ctx,
                                  const SecurityLevel& level,
                                  const AffineGroupStatement& statement,
                                  const AffineGroupWitness& witness,
                                  const RingPedersenParams& verifier_params) {
  const mpz_class& n_hat = verifier_params.n;
  const mpz_class x_range = TwoPow(level.EllBits() + level.EpsilonBits());
  const mpz_class y_range = TwoPow(level.EllPrimeBits() + level.EpsilonBits());
  const mpz_class ell_scale = TwoPow(level.EllBits());

  for (int attempt = 1;; ++attempt) {
    mpz_class alpha = RandomSignedRange(x_range);
    mpz_class beta = RandomSignedRange(y_range);
    mpz_class r = RandomZnStar(statement.receiver_key.n);
    mpz_class r_y = RandomZnStar(statement.prover_key.n);
    mpz_class gamma = RandomSignedRange(x_range * n_hat);
    mpz_class m = RandomSignedRange(ell_scale * n_hat);
    mpz_class delta = RandomSignedRange(x_range * n_hat);
    mpz_class mu = RandomSignedRange(ell_scale * n_hat);

    AffineGroupProof proof;
    proof.a = AffineCombine(statement.receiver_key, statement.c, alpha, beta, r);
    proof.b_x = ECPoint::GeneratorMultiply(Scalar(alpha));
    proof.b_y = statement.prover_key.Encrypt(beta, r_y);
    proof.e_commit = verifier_params.Commit(alpha, gamma);
    proof.s = verifier_params.Commit(witness.x, m);
    proof.f = verifier_params.Commit(beta, delta);
    proof.t = verifier_params.Commit(witness.y, mu);

    const mpz_class e = BuildChallenge(ctx, level, statement, verifier_params, proof);
    proof.z1 = alpha + e * witness.x;
    proof.z2 = beta + e * witness.y;
    proof.z3 = gamma + e * m;
    proof.z4 = delta + e * mu;
    proof.w = MulMod(r, PowModSigned(witness.rho, e, statement.receiver_key.n), statement.receiver_key.n);
    proof.w_y = MulMod(r_y, PowModSigned(witness.rho_y, e, statement.prover_key.n), statement.prover_key.n);

    SecureZeroize(&alpha);
    SecureZeroize(&beta);
    SecureZeroize(&r);
    SecureZeroize(&r_y);
    SecureZeroize(&gamma);
    SecureZeroize(&m);
    SecureZeroize(&delta);
    SecureZeroize(&mu);

    const bool in_range = IsInSignedRange(proof.z1, x_range) && IsInSignedRange(proof.z2, y_range);
    if (in_range || attempt >= kMaxProveAttempts) {
      return proof;
    }
  }
}

ProofCheck VerifyAffineGroup(const ProofContext& ctx,
                             const SecurityLevel& level,
                             const AffineGroupStatement& statement,
                             const RingPedersenParams& verifier_params,
                             const AffineGroupProof& proof) {
  const PaillierPublicKey& n0 = statement.receiver_key;
  const PaillierPublicKey& n1 = statement.prover_key;
  const mpz_class& n_hat = verifier_params.n;

  if (!verifier_params.IsWellFormed() || !n0.IsValidCiphertext(statement.c) ||
      !n0.IsValidCiphertext(statement.d) || !n1.IsValidCiphertext(statement.y)) {
    return ProofCheck::kMalformedStatement;
  }
  if (!n0.IsValidCiphertext(proof.a) || !n1.IsValidCiphertext(proof.b_y) ||
      !IsZnStarElement(proof.w, n0.n) || !IsZnStarElement(proof.w_y, n1.n) ||
      !IsZnStarElement(proof.e_commit, n_hat) || !IsZnStarElement(proof.s, n_hat) ||
      !IsZnStarElement(proof.f, n_hat) || !IsZnStarElement(proof.t, n_hat)) {
    return ProofCheck::kMalformedStatement;
  }
  if (!IsInSignedRange(proof.z1, TwoPow(level.EllBits() + level.EpsilonBits())) ||
      !IsInSignedRange(proof.z2, TwoPow(level.EllPrimeBits() + level.EpsilonBits()))) {
    return ProofCheck::kRangeExceeded;
  }

  const mpz_class e = BuildChallenge(ctx, level, statement, verifier_params, proof);

  if (AffineCombine(n0, statement.c, proof.z1, proof.z2, proof.w) !=
      n0.Add(proof.a, n0.Scale(statement.d, e))) {
    return ProofCheck::kPaillierRelation;
  }
  if (n1.Encrypt(proof.z2, proof.w_y) != n1.Add(proof.b_y, n1.Scale(statement.y, e))) {
    return ProofCheck::kPaillierRelation;
  }
  if (ECPoint::GeneratorMultiply(Scalar(proof.z1)) != proof.b_x.Add(statement.x.Mul(Scalar(e)))) {
    return ProofCheck::kGroupRelation;
  }
  if (verifier_params.Commit(proof.z1, proof.z3) !=
      MulMod(proof.e_commit, PowModSigned(proof.s, e, n_hat), n_hat)) {
    return ProofCheck::kPedersenRelation;
  }
  if (verifier_params.Commit(proof.z2, proof.z4) !=
      MulMod(proof.f, PowModSigned(proof.t, e, n_hat), n_hat)) {
    return ProofCheck::kPedersenRelation;
  }
  return ProofCheck::kOk;
}

void AppendAffineGroupProof(const AffineGroupProof& proof, Bytes* out) {
  AppendMpzField(proof.a, out);
  AppendPoint(proof.b_x, out);
  AppendMpzField(proof.b_y, out);
  AppendMpzField(proof.e_commit, out);
  AppendMpzField(proof.s, out);
  AppendMpzField(proof.f, out);
  AppendMpzField(proof.t, out);
  AppendSignedMpzField(proof.z1, out);
  AppendSignedMpzField(proof.z2, out);
  AppendSignedMpzField(proof.z3, out);
  AppendSignedMpzField(proof.z4, out);
  AppendMpzField(proof.w, out);
  AppendMpzField(proof.w_y, out);
}

AffineGroupProof ReadAffineGroupProof(std::span<const uint8_t> input, size_t* offset) {
  AffineGroupProof out;
  out.a = ReadMpzField(input, offset, kMaxMpzFieldLen, "aff-g proof A");
  out.b_x = ReadPoint(input, offset);
  out.b_y = ReadMpzField(input, offset, kMaxMpzFieldLen, "aff-g proof By");
  out.e_commit = ReadMpzField(input, offset, kMaxMpzFieldLen, "aff-g proof E");
  out.s = ReadMpzField(input, offset, kMaxMpzFieldLen, "aff-g proof S");
  out.f = ReadMpzField(input, offset, kMaxMpzFieldLen, "aff-g proof F");
  out.t = ReadMpzField(input, offset, kMaxMpzFieldLen, "aff-g proof T");
  out.z1 = ReadSignedMpzField(input, offset, kMaxMpzFieldLen, "aff-g proof z1");
  out.z2 = ReadSignedMpzField(input, offset, kMaxMpzFieldLen, "aff-g proof z2");
  out.z3 = ReadSignedMpzField(input, offset, kMaxMpzFieldLen, "aff-g proof z3");
  out.z4 = ReadSignedMpzField(input, offset, kMaxMpzFieldLen, "aff-g proof z4");
  out.w = ReadMpzField(input, offset, kMaxMpzFieldLen, "aff-g proof w");
  out.w_y = ReadMpzField(input, offset, kMaxMpzFieldLen, "aff-g proof wy");
  return out;
}

}  // namespace cggmp
