#include "cggmp/zk/enc_range.hpp"

#include "cggmp/common/secure_zeroize.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/bigint.hpp"

namespace cggmp {
namespace {

constexpr char kEncRangeProofId[] = "CGGMP21/EncRange/v1";
constexpr int kMaxProveAttempts = 64;

mpz_class BuildChallenge(const ProofContext& ctx,
                         const SecurityLevel& level,
                         const EncRangeStatement& statement,
                         const RingPedersenParams& params,
                         const EncRangeProof& proof) {
  Transcript transcript = StartProofTranscript(kEncRangeProofId, ctx);
  transcript.append_mpz("N0", statement.prover_key.n);
  transcript.append_mpz("K", statement.ciphertext);
  transcript.append_mpz("Nhat", params.n);
  transcript.append_mpz("s", params.s);
  transcript.append_mpz("t", params.t);
  transcript.append_mpz("S", proof.s);
  transcript.append_mpz("A", proof.a);
  transcript.append_mpz("C", proof.c);
  return transcript.challenge_signed(level.q);
}

}  // namespace

EncRangeProof ProveEncRange(const ProofContext& ctx,
                            const SecurityLevel& level,
                            const EncRangeStatement& statement,
                            const EncRangeWitness& witness,
                            const RingPedersenParams& verifier_params) {
  const mpz_class& n0 = statement.prover_key.n;
  const mpz_class& n_hat = verifier_params.n;
  const mpz_class range = TwoPow(level.EllBits() + level.EpsilonBits());

  for (int attempt = 1;; ++attempt) {
    mpz_class alpha = RandomSignedRange(range);
    mpz_class mu = RandomSignedRange(TwoPow(level.EllBits()) * n_hat);
    mpz_class r = RandomZnStar(n0);
    mpz_class gamma = RandomSignedRange(range * n_hat);

    EncRangeProof proof;
    proof.s = verifier_params.Commit(witness.plaintext, mu);
    proof.a = statement.prover_key.Encrypt(alpha, r);
    proof.c = verifier_params.Commit(alpha, gamma);

    const mpz_class e = BuildChallenge(ctx, level, statement, verifier_params, proof);
    proof.z1 = alpha + e * witness.plaintext;
    proof.z2 = MulMod(r, PowModSigned(witness.randomness, e, n0), n0);
    proof.z3 = gamma + e * mu;

    SecureZeroize(&alpha);
    SecureZeroize(&mu);
    SecureZeroize(&r);
    SecureZeroize(&gamma);

    // An out-of-range witness never converges; hand back a proof the verifier rejects.
    if (IsInSignedRange(proof.z1, range) || attempt >= kMaxProveAttempts) {
      return proof;
    }
  }
}

ProofCheck VerifyEncRange(const ProofContext& ctx,
                          const SecurityLevel& level,
                          const EncRangeStatement& statement,
                          const RingPedersenParams& verifier_params,
                          const EncRangeProof& proof) {
  const PaillierPublicKey& key = statement.prover_key;
  const mpz_class& n_hat = verifier_params.n;
  if (!verifier_params.IsWellFormed() || !key.IsValidCiphertext(statement.ciphertext)) {
    return ProofCheck::kMalformedStatement;
  }
  if (!key.IsValidCiphertext(proof.a) || !IsZnStarElement(proof.z2, key.n) ||
      !IsZnStarElement(proof.s, n_hat) || !IsZnStarElement(proof.c, n_hat)) {
    return ProofCheck::kMalformedStatement;
  }
  if (!IsInSignedRange(proof.z1, TwoPow(level.EllBits() + level.EpsilonBits()))) {
    return ProofCheck::kRangeExceeded;
  }

  const mpz_class e = BuildChallenge(ctx, level, statement, verifier_params, proof);
  if (key.Encrypt(proof.z1, proof.z2) != key.Add(proof.a, key.Scale(statement.ciphertext, e))) {
    return ProofCheck::kPaillierRelation;
  }
  if (verifier_params.Commit(proof.z1, proof.z3) !=
      MulMod(proof.c, PowModSigned(proof.s, e, n_hat), n_hat)) {
    return ProofCheck::kPedersenRelation;
  }
  return ProofCheck::kOk;
}

void AppendEncRangeProof(const EncRangeProof& proof, Bytes* out) {
  AppendMpzField(proof.s, out);
  AppendMpzField(proof.a, out);
  AppendMpzField(proof.c, out);
  AppendSignedMpzField(proof.z1, out);
  AppendMpzField(proof.z2, out);
  AppendSignedMpzField(proof.z3, out);
}

EncRangeProof ReadEncRangeProof(std::span<const uint8_t> input, size_t* offset) {
  EncRangeProof out;
  out.s = ReadMpzField(input, offset, kMaxMpzFieldLen, "enc proof S");
  out.a = ReadMpzField(input, offset, kMaxMpzFieldLen, "enc proof A");
  out.c = ReadMpzField(input, offset, kMaxMpzFieldLen, "enc proof C");
  out.z1 = ReadSignedMpzField(input, offset, kMaxMpzFieldLen, "enc proof z1");
  out.z2 = ReadMpzField(input, offset, kMaxMpzFieldLen, "enc proof z2");
  out.z3 = ReadSignedMpzField(input, offset, kMaxMpzFieldLen, "enc proof z3");
  return out;
}

}  // namespace cggmp
