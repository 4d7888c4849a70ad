#include <array>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmpxx.h>

#include "cggmp/common/bytes.hpp"
#include "cggmp/common/errors.hpp"
#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/bigint.hpp"
#include "cggmp/crypto/commitment.hpp"
#include "cggmp/crypto/ec_point.hpp"
#include "cggmp/crypto/encoding.hpp"
#include "cggmp/crypto/feldman.hpp"
#include "cggmp/crypto/hash.hpp"
#include "cggmp/crypto/paillier.hpp"
#include "cggmp/crypto/random.hpp"
#include "cggmp/crypto/ring_pedersen.hpp"
#include "cggmp/crypto/scalar.hpp"
#include "cggmp/crypto/security_level.hpp"
#include "cggmp/crypto/transcript.hpp"

namespace {

using cggmp::Bytes;
using cggmp::CommitMessage;
using cggmp::ComputeCommitment;
using cggmp::DecodeMpz;
using cggmp::DecodeSignedMpz;
using cggmp::ECPoint;
using cggmp::EncodeMpz;
using cggmp::EncodeSignedMpz;
using cggmp::PaillierProvider;
using cggmp::PartyIndex;
using cggmp::Polynomial;
using cggmp::Scalar;
using cggmp::SecurityLevel;
using cggmp::Sha256;
using cggmp::Transcript;
using cggmp::VerifyCommitment;

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

Bytes AsciiBytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

void TestMpzRoundTrip() {
  mpz_class huge = 1;
  huge <<= 1023;

  const std::vector<mpz_class> values = {
      mpz_class(0), mpz_class(1), mpz_class(255), mpz_class(256),
      mpz_class("123456789012345678901234567890"), huge};

  for (const auto& value : values) {
    const Bytes encoded = EncodeMpz(value);
    Expect(DecodeMpz(encoded) == value, "mpz round-trip must preserve value");
  }

  Bytes bad = EncodeMpz(mpz_class(42));
  bad.pop_back();
  ExpectThrow([&]() { (void)DecodeMpz(bad); }, "DecodeMpz rejects malformed length");

  for (const mpz_class& value : {mpz_class(-1), mpz_class(0), mpz_class("-98765432109876543210"), huge}) {
    Expect(DecodeSignedMpz(EncodeSignedMpz(value)) == value, "signed mpz encoding must keep the sign");
  }
  Expect(EncodeSignedMpz(mpz_class(-5)) != EncodeSignedMpz(mpz_class(5)),
         "signed encodings of x and -x must differ");
}

void TestWireFields() {
  Bytes out;
  cggmp::AppendU32Be(0x01020304U, &out);
  cggmp::AppendSizedField(AsciiBytes("cggmp"), &out);
  cggmp::AppendScalar(Scalar::FromUint64(77), &out);
  cggmp::AppendSignedMpzField(mpz_class(-123456789), &out);

  size_t offset = 0;
  Expect(cggmp::ReadU32Be(out, &offset) == 0x01020304U, "u32 field should read back big-endian");
  Expect(cggmp::ReadSizedField(out, &offset, 16, "name") == AsciiBytes("cggmp"), "sized field should read back");
  Expect(cggmp::ReadScalar(out, &offset) == Scalar::FromUint64(77), "scalar field should read back");
  Expect(cggmp::ReadSignedMpzField(out, &offset, 64, "signed") == mpz_class(-123456789),
         "signed mpz field should read back");
  cggmp::EnsureFullyConsumed(out, offset, "wire test");

  Bytes trailing = out;
  trailing.push_back(0);
  ExpectThrow([&]() { cggmp::EnsureFullyConsumed(trailing, offset, "wire test"); },
              "trailing bytes must be rejected");

  size_t limited = 4;
  ExpectThrow([&]() { (void)cggmp::ReadSizedField(out, &limited, 2, "name"); },
              "sized field longer than its limit must be rejected");
}

void TestScalarEncodingAndReduction() {
  Scalar five(mpz_class(5));
  const auto five_bytes = five.ToCanonicalBytes();
  Expect(five_bytes[31] == 5, "Scalar canonical encoding should match value");

  Scalar reduced(Scalar::ModulusQ() + 7);
  Expect(reduced == Scalar(mpz_class(7)), "Scalar constructor must reduce mod q");

  const Bytes q_bytes = cggmp::ExportFixedWidth(Scalar::ModulusQ(), 32);
  ExpectThrow([&]() { (void)Scalar::FromCanonicalBytes(q_bytes); },
              "Canonical scalar decoding rejects >= q");
  Expect(Scalar::FromBigEndianModQ(q_bytes).IsZero(), "Non-canonical decoder should reduce mod q");

  const Scalar a = cggmp::Csprng::RandomNonZeroScalar();
  const auto inverse = a.Inverse();
  Expect(inverse.has_value() && a * *inverse == Scalar::FromUint64(1), "Scalar inverse must be multiplicative");
  Expect(!Scalar().Inverse().has_value(), "zero has no inverse");

  const Scalar high(Scalar::ModulusQ() - 1);
  Expect(high.IsHigh() && !(-high).IsHigh(), "negation maps high scalars to low ones");
}

void TestPointEncodingAndArithmetic() {
  const ECPoint g = ECPoint::Generator();
  const Bytes compressed = g.ToCompressedBytes();
  Expect(ECPoint::FromCompressed(compressed) == g, "ECPoint round-trip must preserve valid points");

  Bytes invalid_prefix = compressed;
  invalid_prefix[0] = 0x04;
  ExpectThrow([&]() { (void)ECPoint::FromCompressed(invalid_prefix); },
              "ECPoint rejects non-compressed prefix");

  Bytes invalid_curve(33, 0x00);
  invalid_curve[0] = 0x02;
  ExpectThrow([&]() { (void)ECPoint::FromCompressed(invalid_curve); },
              "ECPoint rejects bytes not on secp256k1 curve");

  const ECPoint g2 = ECPoint::GeneratorMultiply(Scalar::FromUint64(2));
  const ECPoint g3 = ECPoint::GeneratorMultiply(Scalar::FromUint64(3));
  Expect(g.Add(g2) == g3, "ECPoint::Add should match scalar multiplication");
  Expect(g3.Sub(g2) == g, "ECPoint::Sub should undo Add");
  Expect(g3.Mul(Scalar::FromUint64(2)) == ECPoint::GeneratorMultiply(Scalar::FromUint64(6)),
         "ECPoint::Mul should match generator multiplication");
  Expect(g.Add(g.Negate()).IsInfinity(), "P + (-P) must be the point at infinity");
  Expect(ECPoint::Infinity().Add(g) == g, "infinity is the additive identity");

  const ECPoint inf = ECPoint::Infinity();
  Expect(cggmp::DecodePoint(cggmp::EncodePoint(inf)).IsInfinity(), "infinity must survive point encoding");
  Expect(cggmp::DecodePoint(cggmp::EncodePoint(g3)) == g3, "points must survive point encoding");
}

void TestHashAndCommitment() {
  Expect(cggmp::ToHex(Sha256(AsciiBytes("abc"))) ==
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
         "SHA256 must match known test vector for 'abc'");

  // RFC 4231 test case 2.
  const Bytes mac = cggmp::HmacSha512(AsciiBytes("Jefe"), AsciiBytes("what do ya want for nothing?"));
  Expect(cggmp::ToHex(mac) ==
             "164b7a7bfcf819e2e395fbe73b56e0a387bd64222e831fd610270cd7ea250554"
             "9758bf75c05a994a6d034f65f8f0e6fdcaeab1a34d4a6b4b636e070a38bce737",
         "HMAC-SHA512 must match RFC 4231 test case 2");

  const Bytes msg = AsciiBytes("abc");
  const std::string domain = "keygen/commit";
  const Bytes randomness = {1, 2, 3, 4, 5};
  const Bytes commitment = ComputeCommitment(domain, msg, randomness);
  Expect(VerifyCommitment(domain, msg, randomness, commitment), "Commitment verifies for valid open");
  Expect(!VerifyCommitment("aux/commit", msg, randomness, commitment),
         "Commitment must be bound to its domain");

  Bytes tampered_msg = msg;
  tampered_msg[0] ^= 0x01;
  Expect(!VerifyCommitment(domain, tampered_msg, randomness, commitment),
         "Commitment verify fails for tampered message");

  const auto generated = CommitMessage(domain, msg);
  Expect(generated.randomness.size() == 32, "CommitMessage default randomness length is 32");
  Expect(VerifyCommitment(domain, msg, generated.randomness, generated.commitment),
         "CommitMessage output should verify");
}

void TestTranscriptChallenges() {
  const Bytes first = {1, 2, 3};
  const Bytes second = {9, 8};

  Transcript t1;
  t1.append("field1", first);
  t1.append("field2", second);

  Transcript t2;
  t2.append("field1", first);
  t2.append("field2", second);

  Transcript t3;
  t3.append("field2", second);
  t3.append("field1", first);

  Expect(t1.challenge_scalar_mod_q() == t2.challenge_scalar_mod_q(), "Transcript challenge must be deterministic");
  Expect(t1.challenge_scalar_mod_q() != t3.challenge_scalar_mod_q(),
         "Transcript challenge should depend on append order");

  const mpz_class bound = cggmp::TwoPow(256) - 1;
  for (uint32_t i = 0; i < 8; ++i) {
    Transcript t;
    t.append_u32_be("i", i);
    const mpz_class e = t.challenge_signed(bound);
    Expect(cggmp::IsInSignedRange(e, bound), "signed challenge must lie in [-q, q]");
  }

  const mpz_class modulus("1000000007");
  Expect(t1.challenge_mpz_mod(modulus, 0) != t1.challenge_mpz_mod(modulus, 1),
         "indexed challenges should be independent");
  const std::vector<uint8_t> bits = t1.challenge_bits(80);
  Expect(bits.size() == 80, "challenge_bits returns the requested count");
  for (uint8_t bit : bits) {
    Expect(bit <= 1, "challenge bits are 0 or 1");
  }
}

void TestBigIntHelpers() {
  const mpz_class n("1000000007");
  Expect(cggmp::CenterMod(n - 3, n) == -3, "CenterMod maps the upper half to negatives");
  Expect(cggmp::CenterMod(mpz_class(5), n) == 5, "CenterMod keeps small values");
  Expect(cggmp::PowModSigned(mpz_class(3), mpz_class(-1), n) * 3 % n == 1,
         "PowModSigned with -1 computes the inverse");
  Expect(!cggmp::InvertMod(mpz_class(6), mpz_class(9)).has_value(), "non-units have no inverse");
  Expect(cggmp::BitLength(cggmp::TwoPow(100)) == 101, "BitLength(2^100) is 101");
  Expect(cggmp::IsProbablePrime(n), "1e9+7 is prime");
  // 15 = 3 * 5: (2/15) = (2/3)(2/5) = 1 although 2 is not a square mod 15.
  Expect(cggmp::JacobiSymbol(mpz_class(2), mpz_class(15)) == 1, "Jacobi symbol of a non-residue can be 1");
  Expect(cggmp::JacobiSymbol(mpz_class(7), mpz_class(15)) == -1, "Jacobi symbol (7/15) is -1");
  Expect(cggmp::JacobiSymbol(mpz_class(6), mpz_class(15)) == 0, "shared factor gives Jacobi symbol 0");

  for (int i = 0; i < 16; ++i) {
    const mpz_class v = cggmp::RandomSignedRange(mpz_class(1000));
    Expect(cggmp::IsInSignedRange(v, mpz_class(1000)), "RandomSignedRange stays in range");
    Expect(cggmp::IsZnStarElement(cggmp::RandomZnStar(n), n), "RandomZnStar returns units");
  }
}

void TestPaillierViaLibhcs() {
  PaillierProvider paillier(/*modulus_bits=*/512);
  Expect(paillier.VerifyKeyPair(), "Paillier key pair generated by libhcs should verify");
  Expect(paillier.prime_p() % 4 == 3 && paillier.prime_q() % 4 == 3, "Paillier primes must be Blum primes");
  Expect(paillier.prime_p() * paillier.prime_q() == paillier.modulus_n(), "N = pq");

  const cggmp::PaillierPublicKey pk = paillier.public_key();
  const mpz_class a = 50;
  const mpz_class b = 76;

  const auto c_a = pk.EncryptWithRandom(a);
  const auto c_b = pk.EncryptWithRandom(b);
  Expect(pk.IsValidCiphertext(c_a.ciphertext), "fresh ciphertext must be valid");
  Expect(pk.Encrypt(a, c_a.randomness) == c_a.ciphertext, "encryption is reproducible with the same randomness");

  Expect(paillier.Decrypt(pk.Add(c_a.ciphertext, c_b.ciphertext)) == a + b,
         "Paillier encrypted addition should decrypt to a+b");
  Expect(paillier.Decrypt(pk.Scale(c_a.ciphertext, b)) == a * b,
         "Paillier scalar multiplication should decrypt to a*b");

  const auto c_neg = pk.EncryptWithRandom(mpz_class(-17));
  Expect(paillier.DecryptSigned(c_neg.ciphertext) == -17, "DecryptSigned recovers negative plaintexts");

  Expect(!pk.IsValidCiphertext(mpz_class(0)), "zero is not a ciphertext");
  Expect(!pk.IsValidCiphertext(pk.modulus_n2()), "N^2 is out of range");
  ExpectThrow([&]() { (void)pk.Encrypt(a, paillier.prime_p()); }, "randomness must be a unit mod N");
  ExpectThrow([]() { PaillierProvider tiny(64); }, "tiny moduli must be refused");
}

void TestPaillierSafePrimeKey() {
  const SecurityLevel level = SecurityLevel::DevelopmentOnly();
  PaillierProvider paillier(level.paillier_bits);
  Expect(paillier.HasBlumSafePrimes(), "Paillier factors must be safe primes");
  Expect(paillier.VerifyKeyPair(), "loaded factors must form a consistent libhcs key pair");
  Expect(cggmp::BitLength(paillier.modulus_n()) == level.paillier_bits, "N has exactly the requested size");
  Expect(paillier.phi() == (paillier.prime_p() - 1) * (paillier.prime_q() - 1), "phi(N) = (p-1)(q-1)");

  // Plaintexts across the whole of Z_N decrypt through the libhcs key.
  const cggmp::PaillierPublicKey pk = paillier.public_key();
  const mpz_class large = paillier.modulus_n() - 12345;
  Expect(paillier.Decrypt(pk.EncryptWithRandom(large).ciphertext) == large, "large plaintext decrypts");
  const mpz_class negative = -(paillier.modulus_n() / 3);
  Expect(paillier.DecryptSigned(pk.EncryptWithRandom(negative).ciphertext) == negative,
         "large negative plaintext decrypts");

  PaillierProvider other(level.paillier_bits);
  Expect(other.modulus_n() != paillier.modulus_n(), "independent keys have distinct moduli");
}

void TestRingPedersen() {
  PaillierProvider paillier(512);
  const cggmp::RingPedersenSetup setup = cggmp::GenerateRingPedersen(paillier);
  Expect(setup.params.IsWellFormed(), "generated ring-Pedersen parameters are well formed");
  Expect(setup.params.n == paillier.modulus_n(), "ring-Pedersen parameters reuse the Paillier modulus");
  Expect(cggmp::PowMod(setup.params.s, setup.witness.lambda, setup.params.n) == setup.params.t,
         "t = s^lambda");

  const mpz_class c1 = setup.params.Commit(mpz_class(10), mpz_class(-4));
  const mpz_class c2 = setup.params.Commit(mpz_class(3), mpz_class(2));
  Expect(cggmp::MulMod(c1, c2, setup.params.n) == setup.params.Commit(mpz_class(13), mpz_class(-2)),
         "ring-Pedersen commitments are additively homomorphic");

  cggmp::RingPedersenParams bad = setup.params;
  bad.t = 1;
  Expect(!bad.IsWellFormed(), "t = 1 is not a valid generator");
}

void TestFeldmanAndLagrange() {
  const Scalar secret = cggmp::Csprng::RandomNonZeroScalar();
  Polynomial poly = Polynomial::RandomWithConstant(secret, 2);
  const std::vector<ECPoint> commitments = poly.Commit();
  Expect(commitments.size() == 3, "degree-2 polynomial has three commitments");
  Expect(commitments[0] == ECPoint::GeneratorMultiply(secret), "F[0] commits to the secret");

  const std::vector<PartyIndex> ids = {1, 3, 5};
  std::vector<Scalar> shares;
  for (PartyIndex id : ids) {
    shares.push_back(poly.EvaluateAt(id));
    Expect(cggmp::VerifyFeldmanShare(commitments, id, shares.back()), "honest share must verify");
    Expect(cggmp::EvaluateCommitmentAt(commitments, id) == ECPoint::GeneratorMultiply(shares.back()),
           "commitment evaluation matches share");
  }
  Expect(!cggmp::VerifyFeldmanShare(commitments, 2, shares[0]), "share for another index must not verify");

  const auto lagrange = cggmp::ComputeLagrangeAtZero(ids);
  Scalar recovered;
  for (size_t i = 0; i < ids.size(); ++i) {
    recovered = recovered + lagrange.at(ids[i]) * shares[i];
    Expect(lagrange.at(ids[i]) == cggmp::LagrangeCoefficientAtZero(ids, ids[i]),
           "single Lagrange coefficient matches the batch");
  }
  Expect(recovered == secret, "Lagrange interpolation recovers the secret");

  ExpectThrow([&]() { (void)cggmp::ComputeLagrangeAtZero({1, 1}); }, "duplicate ids are rejected");
  poly.Zeroize();
}

void TestSecurityLevels() {
  const SecurityLevel secure = SecurityLevel::ReasonablySecure();
  secure.Validate();
  Expect(secure.paillier_bits == 2048, "reasonably secure level uses 2048-bit moduli");
  Expect(secure.EllBits() == 384 && secure.EllPrimeBits() == 640, "ell bounds follow the level");

  const SecurityLevel dev = SecurityLevel::DevelopmentOnly();
  dev.Validate();

  SecurityLevel broken = dev;
  broken.paillier_bits = 512;
  ExpectThrow([&]() { broken.Validate(); }, "undersized Paillier modulus must be refused");
  broken = dev;
  broken.m = 0;
  ExpectThrow([&]() { broken.Validate(); }, "zero repetitions must be refused");
}

}  // namespace

int main() {
  try {
    TestMpzRoundTrip();
    TestWireFields();
    TestScalarEncodingAndReduction();
    TestPointEncodingAndArithmetic();
    TestHashAndCommitment();
    TestTranscriptChallenges();
    TestBigIntHelpers();
    TestPaillierViaLibhcs();
    TestPaillierSafePrimeKey();
    TestRingPedersen();
    TestFeldmanAndLagrange();
    TestSecurityLevels();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Crypto primitive tests passed" << '\n';
  return 0;
}
