#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <gmpxx.h>

#include "cggmp/common/bytes.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/bigint.hpp"
#include "cggmp/crypto/ec_point.hpp"
#include "cggmp/crypto/paillier.hpp"
#include "cggmp/crypto/random.hpp"
#include "cggmp/crypto/ring_pedersen.hpp"
#include "cggmp/crypto/security_level.hpp"
#include "cggmp/zk/affine_group.hpp"
#include "cggmp/zk/enc_range.hpp"
#include "cggmp/zk/log_star.hpp"
#include "cggmp/zk/no_small_factor.hpp"
#include "cggmp/zk/paillier_mod.hpp"
#include "cggmp/zk/proof_context.hpp"
#include "cggmp/zk/ring_pedersen_params.hpp"
#include "cggmp/zk/schnorr.hpp"

namespace {

using cggmp::Bytes;
using cggmp::ECPoint;
using cggmp::PaillierProvider;
using cggmp::PaillierPublicKey;
using cggmp::ProofCheck;
using cggmp::ProofContext;
using cggmp::RingPedersenSetup;
using cggmp::Scalar;
using cggmp::SecurityLevel;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

void ExpectCheck(ProofCheck actual, ProofCheck expected, const std::string& message) {
  if (actual != expected) {
    throw std::runtime_error("Test failed: " + message + " (got " + cggmp::ProofCheckName(actual) + ", want " +
                             cggmp::ProofCheckName(expected) + ")");
  }
}

// Keys are expensive; every test shares one prover and one verifier.
struct Fixture {
  SecurityLevel level = SecurityLevel::DevelopmentOnly();
  std::unique_ptr<PaillierProvider> prover;
  std::unique_ptr<PaillierProvider> verifier;
  RingPedersenSetup verifier_setup;

  Fixture()
      : prover(std::make_unique<PaillierProvider>(level.paillier_bits)),
        verifier(std::make_unique<PaillierProvider>(level.paillier_bits)),
        verifier_setup(cggmp::GenerateRingPedersen(*verifier)) {}
};

ProofContext MakeContext(uint32_t round, const std::string& tag) {
  return ProofContext{
      .session_id = Bytes{0xC0, 0xFF, 0xEE, 0x01},
      .prover = 1,
      .verifier = 2,
      .round = round,
      .tag = Bytes(tag.begin(), tag.end()),
  };
}

void TestSchnorr() {
  const ProofContext ctx = MakeContext(1, "schnorr");
  const Scalar x = cggmp::Csprng::RandomNonZeroScalar();
  const ECPoint statement = ECPoint::GeneratorMultiply(x);

  const cggmp::SchnorrProof proof = cggmp::ProveSchnorr(ctx, statement, x);
  ExpectCheck(cggmp::VerifySchnorr(ctx, statement, proof), ProofCheck::kOk, "honest Schnorr proof");

  Bytes encoded;
  cggmp::AppendSchnorrProof(proof, &encoded);
  size_t offset = 0;
  const cggmp::SchnorrProof decoded = cggmp::ReadSchnorrProof(encoded, &offset);
  cggmp::EnsureFullyConsumed(encoded, offset, "schnorr proof");
  ExpectCheck(cggmp::VerifySchnorr(ctx, statement, decoded), ProofCheck::kOk, "decoded Schnorr proof");

  const cggmp::SchnorrProof wrong = cggmp::ProveSchnorr(ctx, statement, x + Scalar::FromUint64(1));
  ExpectCheck(cggmp::VerifySchnorr(ctx, statement, wrong), ProofCheck::kGroupRelation,
              "Schnorr proof with a wrong witness");

  ProofContext other = ctx;
  other.prover = 3;
  ExpectCheck(cggmp::VerifySchnorr(other, statement, proof), ProofCheck::kGroupRelation,
              "Schnorr proof must be bound to the prover id");
}

void TestRingPedersenParamProof(const Fixture& f) {
  const ProofContext ctx = MakeContext(2, "prm");
  const auto proof =
      cggmp::ProveRingPedersenParams(ctx, f.verifier_setup.params, f.verifier_setup.witness, f.level.m);
  ExpectCheck(cggmp::VerifyRingPedersenParams(ctx, f.verifier_setup.params, proof, f.level.m), ProofCheck::kOk,
              "honest prm proof");

  Bytes encoded;
  cggmp::AppendRingPedersenParamProof(proof, &encoded);
  size_t offset = 0;
  const auto decoded = cggmp::ReadRingPedersenParamProof(encoded, &offset);
  ExpectCheck(cggmp::VerifyRingPedersenParams(ctx, f.verifier_setup.params, decoded, f.level.m), ProofCheck::kOk,
              "decoded prm proof");

  cggmp::RingPedersenParams tampered = f.verifier_setup.params;
  tampered.t = cggmp::MulMod(tampered.t, tampered.s, tampered.n);
  Expect(cggmp::VerifyRingPedersenParams(ctx, tampered, proof, f.level.m) != ProofCheck::kOk,
         "prm proof must not carry over to different parameters");
  Expect(cggmp::VerifyRingPedersenParams(ctx, f.verifier_setup.params, proof, f.level.m + 1) != ProofCheck::kOk,
         "prm proof with the wrong repetition count");
}

void TestPaillierModProof(const Fixture& f) {
  const ProofContext ctx = MakeContext(3, "mod");
  const mpz_class n = f.prover->modulus_n();
  const auto proof = cggmp::ProvePaillierMod(ctx, n, f.prover->prime_p(), f.prover->prime_q(), f.level.m);
  ExpectCheck(cggmp::VerifyPaillierMod(ctx, n, proof, f.level.m), ProofCheck::kOk, "honest mod proof");

  Bytes encoded;
  cggmp::AppendPaillierModProof(proof, &encoded);
  size_t offset = 0;
  const auto decoded = cggmp::ReadPaillierModProof(encoded, &offset);
  ExpectCheck(cggmp::VerifyPaillierMod(ctx, n, decoded, f.level.m), ProofCheck::kOk, "decoded mod proof");

  Expect(cggmp::VerifyPaillierMod(ctx, f.verifier->modulus_n(), proof, f.level.m) != ProofCheck::kOk,
         "mod proof must not verify against another modulus");
  ExpectCheck(cggmp::VerifyPaillierMod(ctx, mpz_class(1000003), proof, f.level.m), ProofCheck::kModulusMalformed,
              "prime modulus is rejected");
  ExpectThrow([&]() { (void)cggmp::ProvePaillierMod(ctx, n, f.prover->prime_p(), mpz_class(7), f.level.m); },
              "mod prover refuses a wrong factorization");
}

void TestNoSmallFactorProof(const Fixture& f) {
  const ProofContext ctx = MakeContext(3, "fac");
  const mpz_class n = f.prover->modulus_n();
  const auto proof =
      cggmp::ProveNoSmallFactor(ctx, f.level, n, f.prover->prime_p(), f.prover->prime_q(), f.verifier_setup.params);
  ExpectCheck(cggmp::VerifyNoSmallFactor(ctx, f.level, n, f.verifier_setup.params, proof), ProofCheck::kOk,
              "honest fac proof");

  ExpectThrow([&]() {
    (void)cggmp::ProveNoSmallFactor(ctx, f.level, n, f.prover->prime_p(), mpz_class(3), f.verifier_setup.params);
  }, "fac prover refuses a wrong factorization");

  // N0 = p * q with a small p drives the q response out of range.
  mpz_class small_p;
  mpz_class large_q;
  const mpz_class small_seed = cggmp::TwoPow(100);
  const mpz_class large_seed = cggmp::TwoPow(f.level.paillier_bits - 101);
  mpz_nextprime(small_p.get_mpz_t(), small_seed.get_mpz_t());
  mpz_nextprime(large_q.get_mpz_t(), large_seed.get_mpz_t());
  const mpz_class unbalanced = small_p * large_q;
  const auto bad =
      cggmp::ProveNoSmallFactor(ctx, f.level, unbalanced, small_p, large_q, f.verifier_setup.params);
  ExpectCheck(cggmp::VerifyNoSmallFactor(ctx, f.level, unbalanced, f.verifier_setup.params, bad),
              ProofCheck::kRangeExceeded, "modulus with a small factor");
}

void TestEncRangeProof(const Fixture& f) {
  const ProofContext ctx = MakeContext(1, "k");
  const PaillierPublicKey pk = f.prover->public_key();
  const Scalar k = cggmp::Csprng::RandomNonZeroScalar();
  const auto enc = pk.EncryptWithRandom(k.value());

  const cggmp::EncRangeStatement statement{.prover_key = pk, .ciphertext = enc.ciphertext};
  const cggmp::EncRangeWitness witness{.plaintext = k.value(), .randomness = enc.randomness};
  const auto proof = cggmp::ProveEncRange(ctx, f.level, statement, witness, f.verifier_setup.params);
  ExpectCheck(cggmp::VerifyEncRange(ctx, f.level, statement, f.verifier_setup.params, proof), ProofCheck::kOk,
              "honest enc proof");

  Bytes encoded;
  cggmp::AppendEncRangeProof(proof, &encoded);
  size_t offset = 0;
  const auto decoded = cggmp::ReadEncRangeProof(encoded, &offset);
  ExpectCheck(cggmp::VerifyEncRange(ctx, f.level, statement, f.verifier_setup.params, decoded), ProofCheck::kOk,
              "decoded enc proof");

  const cggmp::EncRangeStatement other_cipher{.prover_key = pk, .ciphertext = pk.EncryptWithRandom(1).ciphertext};
  ExpectCheck(cggmp::VerifyEncRange(ctx, f.level, other_cipher, f.verifier_setup.params, proof),
              ProofCheck::kPaillierRelation, "enc proof for another ciphertext");

  const mpz_class huge = cggmp::TwoPow(f.level.EllBits() + f.level.EpsilonBits() + 8);
  const auto huge_enc = pk.EncryptWithRandom(huge);
  const cggmp::EncRangeStatement huge_statement{.prover_key = pk, .ciphertext = huge_enc.ciphertext};
  const auto huge_proof = cggmp::ProveEncRange(
      ctx, f.level, huge_statement, {.plaintext = huge, .randomness = huge_enc.randomness}, f.verifier_setup.params);
  ExpectCheck(cggmp::VerifyEncRange(ctx, f.level, huge_statement, f.verifier_setup.params, huge_proof),
              ProofCheck::kRangeExceeded, "enc proof of an out-of-range plaintext");

  cggmp::RingPedersenParams malformed = f.verifier_setup.params;
  malformed.s = 1;
  ExpectCheck(cggmp::VerifyEncRange(ctx, f.level, statement, malformed, proof), ProofCheck::kMalformedStatement,
              "enc proof against malformed verifier parameters");
}

void TestLogStarProof(const Fixture& f) {
  const ProofContext ctx = MakeContext(2, "gamma-log");
  const PaillierPublicKey pk = f.prover->public_key();
  const Scalar gamma = cggmp::Csprng::RandomNonZeroScalar();
  const auto enc = pk.EncryptWithRandom(gamma.value());

  // A non-generator base, as used for Delta = k * Gamma.
  const ECPoint base = ECPoint::GeneratorMultiply(cggmp::Csprng::RandomNonZeroScalar());
  const cggmp::LogStarStatement statement{
      .prover_key = pk, .ciphertext = enc.ciphertext, .x = base.Mul(gamma), .base = base};
  const cggmp::LogStarWitness witness{.x = gamma.value(), .rho = enc.randomness};

  const auto proof = cggmp::ProveLogStar(ctx, f.level, statement, witness, f.verifier_setup.params);
  ExpectCheck(cggmp::VerifyLogStar(ctx, f.level, statement, f.verifier_setup.params, proof), ProofCheck::kOk,
              "honest log* proof");

  Bytes encoded;
  cggmp::AppendLogStarProof(proof, &encoded);
  size_t offset = 0;
  const auto decoded = cggmp::ReadLogStarProof(encoded, &offset);
  ExpectCheck(cggmp::VerifyLogStar(ctx, f.level, statement, f.verifier_setup.params, decoded), ProofCheck::kOk,
              "decoded log* proof");

  cggmp::LogStarStatement wrong_point = statement;
  wrong_point.x = base.Mul(gamma + Scalar::FromUint64(1));
  Expect(cggmp::VerifyLogStar(ctx, f.level, wrong_point, f.verifier_setup.params, proof) != ProofCheck::kOk,
         "log* proof for a different discrete log");

  const ProofContext replayed = MakeContext(2, "delta");
  Expect(cggmp::VerifyLogStar(replayed, f.level, statement, f.verifier_setup.params, proof) != ProofCheck::kOk,
         "log* proof must be bound to its label");
}

void TestAffineGroupProof(const Fixture& f) {
  const ProofContext ctx = MakeContext(2, "gamma");
  const PaillierPublicKey receiver = f.verifier->public_key();
  const PaillierPublicKey prover = f.prover->public_key();

  const Scalar k = cggmp::Csprng::RandomNonZeroScalar();
  const Scalar x = cggmp::Csprng::RandomNonZeroScalar();
  const mpz_class y = cggmp::RandomSignedRange(cggmp::TwoPow(f.level.EllPrimeBits()));

  const mpz_class c = receiver.EncryptWithRandom(k.value()).ciphertext;
  const auto receiver_mask = receiver.EncryptWithRandom(y);
  const mpz_class d = receiver.Add(receiver.Scale(c, x.value()), receiver_mask.ciphertext);
  const auto prover_mask = prover.EncryptWithRandom(y);

  const cggmp::AffineGroupStatement statement{
      .receiver_key = receiver,
      .prover_key = prover,
      .c = c,
      .d = d,
      .y = prover_mask.ciphertext,
      .x = ECPoint::GeneratorMultiply(x),
  };
  const cggmp::AffineGroupWitness witness{
      .x = x.value(), .y = y, .rho = receiver_mask.randomness, .rho_y = prover_mask.randomness};

  const auto proof = cggmp::ProveAffineGroup(ctx, f.level, statement, witness, f.verifier_setup.params);
  ExpectCheck(cggmp::VerifyAffineGroup(ctx, f.level, statement, f.verifier_setup.params, proof), ProofCheck::kOk,
              "honest aff-g proof");

  Bytes encoded;
  cggmp::AppendAffineGroupProof(proof, &encoded);
  size_t offset = 0;
  const auto decoded = cggmp::ReadAffineGroupProof(encoded, &offset);
  cggmp::EnsureFullyConsumed(encoded, offset, "aff-g proof");
  ExpectCheck(cggmp::VerifyAffineGroup(ctx, f.level, statement, f.verifier_setup.params, decoded), ProofCheck::kOk,
              "decoded aff-g proof");

  Expect(f.verifier->DecryptSigned(d) == k.value() * x.value() + y,
         "D decrypts to k * x + y");

  cggmp::AffineGroupStatement shifted = statement;
  shifted.d = receiver.Add(d, receiver.EncryptWithRandom(1).ciphertext);
  ExpectCheck(cggmp::VerifyAffineGroup(ctx, f.level, shifted, f.verifier_setup.params, proof),
              ProofCheck::kPaillierRelation, "aff-g proof for a shifted D");

  cggmp::AffineGroupStatement wrong_point = statement;
  wrong_point.x = ECPoint::GeneratorMultiply(x + Scalar::FromUint64(1));
  Expect(cggmp::VerifyAffineGroup(ctx, f.level, wrong_point, f.verifier_setup.params, proof) != ProofCheck::kOk,
         "aff-g proof for a different X");
}

}  // namespace

int main() {
  try {
    TestSchnorr();
    const Fixture fixture;
    TestRingPedersenParamProof(fixture);
    TestPaillierModProof(fixture);
    TestNoSmallFactorProof(fixture);
    TestEncRangeProof(fixture);
    TestLogStarProof(fixture);
    TestAffineGroupProof(fixture);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "ZK proof tests passed" << '\n';
  return 0;
}
