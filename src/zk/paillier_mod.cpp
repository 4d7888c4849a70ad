#include "cggmp/zk/paillier_mod.hpp"

#include <stdexcept>

#include "cggmp/common/errors.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/bigint.hpp"

namespace cggmp {
namespace {

constexpr char kPaillierModProofId[] = "CGGMP21/PaillierBlumModulus/v1";
constexpr uint32_t kMaxRepetitions = 1024;

Transcript BuildModTranscript(const ProofContext& ctx, const mpz_class& n, const mpz_class& w) {
  Transcript transcript = StartProofTranscript(kPaillierModProofId, ctx);
  transcript.append_mpz("N", n);
  transcript.append_mpz("w", w);
  return transcript;
}

bool IsQuadraticResidueModPrime(const mpz_class& value, const mpz_class& prime) {
  return JacobiSymbol(value, prime) == 1;
}

// Fourth root of a residue modulo a prime p = 3 (mod 4).
mpz_class FourthRootModPrime(const mpz_class& value, const mpz_class& prime) {
  const mpz_class quarter = (prime + 1) / 4;
  const mpz_class exponent = NormalizeMod(quarter * quarter, prime - 1);
  return PowMod(NormalizeMod(value, prime), exponent, prime);
}

mpz_class CrtCombine(const mpz_class& residue_p,
                     const mpz_class& p,
                     const mpz_class& residue_q,
                     const mpz_class& q) {
  const std::optional<mpz_class> p_inv = InvertMod(p, q);
  if (!p_inv.has_value()) {
    throw CryptoFailure("CRT factors are not coprime");
  }
  const mpz_class h = MulMod(residue_q - residue_p, *p_inv, q);
  return residue_p + p * h;
}

mpz_class ApplyAdjustment(const mpz_class& y, bool a, bool b, const mpz_class& w, const mpz_class& n) {
  mpz_class out = y;
  if (a) {
    out = NormalizeMod(-out, n);
  }
  if (b) {
    out = MulMod(out, w, n);
  }
  return out;
}

}  // namespace

PaillierModProof ProvePaillierMod(const ProofContext& ctx,
                                  const mpz_class& n,
                                  const mpz_class& p,
                                  const mpz_class& q,
                                  uint32_t repetitions) {
  if (p * q != n || p % 4 != 3 || q % 4 != 3) {
    throw std::invalid_argument("Paillier-Blum proof requires N = pq with p = q = 3 mod 4");
  }

  const mpz_class phi = (p - 1) * (q - 1);
  const std::optional<mpz_class> n_inv = InvertMod(n, phi);
  if (!n_inv.has_value()) {
    throw std::invalid_argument("N is not invertible mod phi(N)");
  }

  PaillierModProof proof;
  do {
    proof.w = RandomZnStar(n);
  } while (JacobiSymbol(proof.w, n) != -1);

  const Transcript transcript = BuildModTranscript(ctx, n, proof.w);
  proof.rounds.reserve(repetitions);
  for (uint32_t i = 0; i < repetitions; ++i) {
    const mpz_class y = transcript.challenge_mpz_mod(n, i);
    if (!IsZnStarElement(y, n)) {
      throw CryptoFailure("Paillier-Blum challenge is not a unit");
    }

    PaillierModRound round;
    bool found = false;
    for (int a = 0; a < 2 && !found; ++a) {
      for (int b = 0; b < 2 && !found; ++b) {
        const mpz_class adjusted = ApplyAdjustment(y, a != 0, b != 0, proof.w, n);
        if (IsQuadraticResidueModPrime(adjusted, p) && IsQuadraticResidueModPrime(adjusted, q)) {
          round.a = a != 0;
          round.b = b != 0;
          round.x = CrtCombine(FourthRootModPrime(adjusted, p), p, FourthRootModPrime(adjusted, q), q);
          found = true;
        }
      }
    }
    if (!found) {
      throw CryptoFailure("no residue adjustment found for Paillier-Blum challenge");
    }
    round.z = PowMod(y, *n_inv, n);
    proof.rounds.push_back(std::move(round));
  }
  return proof;
}

ProofCheck VerifyPaillierMod(const ProofContext& ctx,
                             const mpz_class& n,
                             const PaillierModProof& proof,
                             uint32_t repetitions) {
  if (n <= 3 || mpz_even_p(n.get_mpz_t()) != 0 || IsProbablePrime(n)) {
    return ProofCheck::kModulusMalformed;
  }
  if (proof.rounds.size() != repetitions) {
    return ProofCheck::kMalformedStatement;
  }
  if (!IsZnStarElement(proof.w, n) || JacobiSymbol(proof.w, n) != -1) {
    return ProofCheck::kModulusMalformed;
  }

  const Transcript transcript = BuildModTranscript(ctx, n, proof.w);
  for (uint32_t i = 0; i < repetitions; ++i) {
    const PaillierModRound& round = proof.rounds[i];
    if (round.x <= 0 || round.x >= n || round.z <= 0 || round.z >= n) {
      return ProofCheck::kMalformedStatement;
    }

    const mpz_class y = transcript.challenge_mpz_mod(n, i);
    if (PowMod(round.z, n, n) != y) {
      return ProofCheck::kModulusMalformed;
    }
    const mpz_class x4 = PowMod(round.x, 4, n);
    if (x4 != ApplyAdjustment(y, round.a, round.b, proof.w, n)) {
      return ProofCheck::kModulusMalformed;
    }
  }
  return ProofCheck::kOk;
}

void AppendPaillierModProof(const PaillierModProof& proof, Bytes* out) {
  AppendMpzField(proof.w, out);
  AppendU32Be(static_cast<uint32_t>(proof.rounds.size()), out);
  for (const PaillierModRound& round : proof.rounds) {
    AppendMpzField(round.x, out);
    out->push_back(round.a ? 1 : 0);
    out->push_back(round.b ? 1 : 0);
    AppendMpzField(round.z, out);
  }
}

PaillierModProof ReadPaillierModProof(std::span<const uint8_t> input, size_t* offset) {
  PaillierModProof out;
  out.w = ReadMpzField(input, offset, kMaxMpzFieldLen, "mod proof w");
  const uint32_t count = ReadU32Be(input, offset);
  if (count > kMaxRepetitions) {
    throw std::invalid_argument("mod proof has too many rounds");
  }
  out.rounds.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    PaillierModRound round;
    round.x = ReadMpzField(input, offset, kMaxMpzFieldLen, "mod proof x");
    const Bytes flags = ReadFixedField(input, offset, 2, "mod proof flags");
    if (flags[0] > 1 || flags[1] > 1) {
      throw std::invalid_argument("mod proof flags must be 0 or 1");
    }
    round.a = flags[0] == 1;
    round.b = flags[1] == 1;
    round.z = ReadMpzField(input, offset, kMaxMpzFieldLen, "mod proof z");
    out.rounds.push_back(std::move(round));
  }
  return out;
}

}  // namespace cggmp
