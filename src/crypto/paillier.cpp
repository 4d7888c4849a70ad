#include "cggmp/crypto/paillier.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include <openssl/bn.h>

#include "cggmp/common/errors.hpp"
#include "cggmp/common/secure_zeroize.hpp"
#include "cggmp/crypto/bigint.hpp"

namespace cggmp {
namespace {

constexpr int kMaxKeyGenerationAttempts = 16;

using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;

// OpenSSL sets the top two bits, so the product of two such primes has
// exactly the sum of their bit lengths.
mpz_class GenerateSafePrime(int bits) {
  BignumPtr prime(BN_new(), &BN_clear_free);
  if (prime == nullptr) {
    throw CryptoFailure("BN_new failed");
  }
  if (BN_generate_prime_ex(prime.get(), bits, /*safe=*/1, nullptr, nullptr, nullptr) != 1) {
    throw CryptoFailure("BN_generate_prime_ex failed to produce a safe prime");
  }

  std::vector<unsigned char> raw(static_cast<size_t>(BN_num_bytes(prime.get())));
  BN_bn2bin(prime.get(), raw.data());
  mpz_class out;
  mpz_import(out.get_mpz_t(), raw.size(), 1, 1, 1, 0, raw.data());
  std::fill(raw.begin(), raw.end(), 0);
  return out;
}

bool IsSafePrime(const mpz_class& p) {
  if ((p % 4) != 3) {
    return false;
  }
  const mpz_class half = (p - 1) / 2;
  return IsProbablePrime(p) && IsProbablePrime(half);
}

}  // namespace

mpz_class PaillierPublicKey::modulus_n2() const {
  return n * n;
}

mpz_class PaillierPublicKey::Encrypt(const mpz_class& plaintext, const mpz_class& randomness) const {
  if (!IsZnStarElement(randomness, n)) {
    throw std::invalid_argument("Paillier randomness must be in Z*_N");
  }

  const mpz_class n2 = modulus_n2();
  const mpz_class m = NormalizeMod(plaintext, n);
  const mpz_class gm = NormalizeMod(1 + m * n, n2);
  return MulMod(gm, PowMod(randomness, n, n2), n2);
}

PaillierCiphertextWithRandom PaillierPublicKey::EncryptWithRandom(const mpz_class& plaintext) const {
  PaillierCiphertextWithRandom out;
  out.randomness = RandomZnStar(n);
  out.ciphertext = Encrypt(plaintext, out.randomness);
  return out;
}

mpz_class PaillierPublicKey::Add(const mpz_class& lhs_cipher, const mpz_class& rhs_cipher) const {
  return MulMod(lhs_cipher, rhs_cipher, modulus_n2());
}

mpz_class PaillierPublicKey::Scale(const mpz_class& cipher, const mpz_class& scalar) const {
  return PowModSigned(cipher, scalar, modulus_n2());
}

bool PaillierPublicKey::IsValidCiphertext(const mpz_class& cipher) const {
  return IsZnStarElement(cipher, modulus_n2());
}

PaillierProvider::PaillierProvider() {
  pk_ = pcs_init_public_key();
  sk_ = pcs_init_private_key();

  if (pk_ == nullptr || sk_ == nullptr) {
    Cleanup();
    throw CryptoFailure("Failed to initialize libhcs Paillier structures");
  }
}

PaillierProvider::PaillierProvider(unsigned long modulus_bits) : PaillierProvider() {
  if (modulus_bits < 256) {
    Cleanup();
    throw std::invalid_argument("Paillier modulus_bits must be >= 256");
  }

  // pcs_generate_key_pair draws plain primes; the modulus proofs need safe
  // ones, so the factors are generated here and loaded into libhcs.
  const int p_bits = static_cast<int>((modulus_bits + 1) / 2);
  const int q_bits = static_cast<int>(modulus_bits / 2);
  try {
    for (int attempt = 1; attempt <= kMaxKeyGenerationAttempts; ++attempt) {
      mpz_class p = GenerateSafePrime(p_bits);
      mpz_class q = GenerateSafePrime(q_bits);
      if (p != q) {
        LoadFactors(p, q);
        SecureZeroize(&p);
        SecureZeroize(&q);
        if (VerifyKeyPair() && HasBlumSafePrimes() && BitLength(modulus_n()) == modulus_bits) {
          return;
        }
      }
      BOOST_LOG_TRIVIAL(debug) << str(boost::format("Paillier key attempt %1% rejected, regenerating") % attempt);
    }
  } catch (const CryptoFailure&) {
    Cleanup();
    throw;
  }

  Cleanup();
  throw CryptoFailure("Paillier safe-prime key generation exhausted its attempts");
}

PaillierProvider PaillierProvider::FromFactors(const mpz_class& p, const mpz_class& q) {
  if (p == q || !IsSafePrime(p) || !IsSafePrime(q)) {
    throw std::invalid_argument("Paillier factors must be distinct safe primes");
  }
  PaillierProvider provider;
  provider.LoadFactors(p, q);
  if (!provider.VerifyKeyPair()) {
    throw CryptoFailure("Paillier key rebuilt from its factors does not verify");
  }
  return provider;
}

PaillierProvider::~PaillierProvider() {
  Cleanup();
}

PaillierProvider::PaillierProvider(PaillierProvider&& other) noexcept
    : pk_(other.pk_), sk_(other.sk_) {
  other.pk_ = nullptr;
  other.sk_ = nullptr;
}

PaillierProvider& PaillierProvider::operator=(PaillierProvider&& other) noexcept {
  if (this != &other) {
    Cleanup();
    pk_ = other.pk_;
    sk_ = other.sk_;
    other.pk_ = nullptr;
    other.sk_ = nullptr;
  }
  return *this;
}

PaillierPublicKey PaillierProvider::public_key() const {
  return PaillierPublicKey{.n = modulus_n()};
}

mpz_class PaillierProvider::modulus_n() const {
  return mpz_class(pk_->n);
}

mpz_class PaillierProvider::modulus_n2() const {
  return mpz_class(pk_->n2);
}

mpz_class PaillierProvider::prime_p() const {
  return mpz_class(sk_->p);
}

mpz_class PaillierProvider::prime_q() const {
  return mpz_class(sk_->q);
}

mpz_class PaillierProvider::phi() const {
  return (prime_p() - 1) * (prime_q() - 1);
}

mpz_class PaillierProvider::Decrypt(const mpz_class& ciphertext) const {
  if (!IsZnStarElement(ciphertext, modulus_n2())) {
    throw std::invalid_argument("Paillier ciphertext is not in Z*_{N^2}");
  }

  mpz_class cipher = ciphertext;
  mpz_class out;
  pcs_decrypt(sk_, out.get_mpz_t(), cipher.get_mpz_t());
  return out;
}

mpz_class PaillierProvider::DecryptSigned(const mpz_class& ciphertext) const {
  return CenterMod(Decrypt(ciphertext), modulus_n());
}

bool PaillierProvider::VerifyKeyPair() const {
  if (pk_ == nullptr || sk_ == nullptr) {
    return false;
  }
  return pcs_verify_key_pair(pk_, sk_) != 0;
}

bool PaillierProvider::HasBlumSafePrimes() const {
  const mpz_class p = prime_p();
  const mpz_class q = prime_q();
  if (p == q || p * q != modulus_n()) {
    return false;
  }
  return IsSafePrime(p) && IsSafePrime(q);
}

void PaillierProvider::LoadFactors(const mpz_class& p, const mpz_class& q) {
  const mpz_class n = p * q;
  const mpz_class n2 = n * n;
  const mpz_class g = n + 1;

  mpz_set(pk_->n, n.get_mpz_t());
  mpz_set(pk_->n2, n2.get_mpz_t());
  mpz_set(pk_->g, g.get_mpz_t());

  mpz_set(sk_->p, p.get_mpz_t());
  mpz_set(sk_->q, q.get_mpz_t());
  mpz_set(sk_->n, n.get_mpz_t());
  mpz_set(sk_->n2, n2.get_mpz_t());

  mpz_class p2 = p * p;
  mpz_class q2 = q * q;
  mpz_set(sk_->p2, p2.get_mpz_t());
  mpz_set(sk_->q2, q2.get_mpz_t());

  // h_p = L_p(g^(p-1) mod p^2)^-1 mod p, and likewise for q.
  const auto crt_helper = [&g](const mpz_class& prime, const mpz_class& prime2) {
    const mpz_class lifted = PowMod(g, prime - 1, prime2);
    const mpz_class l_value = (lifted - 1) / prime;
    const std::optional<mpz_class> inverse = InvertMod(l_value, prime);
    if (!inverse.has_value()) {
      throw CryptoFailure("Paillier CRT helper is not invertible");
    }
    return *inverse;
  };
  mpz_class hp = crt_helper(p, p2);
  mpz_class hq = crt_helper(q, q2);
  mpz_set(sk_->hp, hp.get_mpz_t());
  mpz_set(sk_->hq, hq.get_mpz_t());

  mpz_class lambda;
  const mpz_class p_minus_one = p - 1;
  const mpz_class q_minus_one = q - 1;
  mpz_lcm(lambda.get_mpz_t(), p_minus_one.get_mpz_t(), q_minus_one.get_mpz_t());
  // With g = N + 1, L(g^lambda mod N^2) = lambda mod N.
  const std::optional<mpz_class> mu = InvertMod(lambda, n);
  if (!mu.has_value()) {
    throw CryptoFailure("Paillier lambda is not invertible mod N");
  }
  mpz_set(sk_->lambda, lambda.get_mpz_t());
  mpz_set(sk_->mu, mu->get_mpz_t());

  SecureZeroize(&p2);
  SecureZeroize(&q2);
  SecureZeroize(&hp);
  SecureZeroize(&hq);
  SecureZeroize(&lambda);
}

void PaillierProvider::Cleanup() {
  if (sk_ != nullptr) {
    pcs_free_private_key(sk_);
    sk_ = nullptr;
  }
  if (pk_ != nullptr) {
    pcs_free_public_key(pk_);
    pk_ = nullptr;
  }
}

}  // namespace cggmp
