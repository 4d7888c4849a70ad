#pragma once

#include <gmpxx.h>

extern "C" {
#include <libhcs/pcs.h>
}

namespace cggmp {

struct PaillierCiphertextWithRandom {
  mpz_class ciphertext;
  mpz_class randomness;
};

// Public half of a Paillier key with generator N + 1. Plaintexts may be
// negative; they are reduced mod N before encryption.
struct PaillierPublicKey {
  mpz_class n;

  mpz_class modulus_n2() const;

  mpz_class Encrypt(const mpz_class& plaintext, const mpz_class& randomness) const;
  PaillierCiphertextWithRandom EncryptWithRandom(const mpz_class& plaintext) const;

  mpz_class Add(const mpz_class& lhs_cipher, const mpz_class& rhs_cipher) const;
  // cipher^scalar mod N^2; negative scalars use the ciphertext inverse.
  mpz_class Scale(const mpz_class& cipher, const mpz_class& scalar) const;

  bool IsValidCiphertext(const mpz_class& cipher) const;

  bool operator==(const PaillierPublicKey& other) const { return n == other.n; }
};

// libhcs-backed private key. The factors are OpenSSL safe primes, so
// p = q = 3 (mod 4) and they can back the modulus proofs.
class PaillierProvider {
 public:
  explicit PaillierProvider(unsigned long modulus_bits);
  // Rebuilds a stored key. Throws std::invalid_argument unless p and q are
  // distinct safe primes.
  static PaillierProvider FromFactors(const mpz_class& p, const mpz_class& q);
  ~PaillierProvider();

  PaillierProvider(const PaillierProvider&) = delete;
  PaillierProvider& operator=(const PaillierProvider&) = delete;

  PaillierProvider(PaillierProvider&& other) noexcept;
  PaillierProvider& operator=(PaillierProvider&& other) noexcept;

  PaillierPublicKey public_key() const;
  mpz_class modulus_n() const;
  mpz_class modulus_n2() const;

  mpz_class prime_p() const;
  mpz_class prime_q() const;
  mpz_class phi() const;

  // Plaintext in [0, N). Throws std::invalid_argument for a ciphertext
  // outside Z*_{N^2}.
  mpz_class Decrypt(const mpz_class& ciphertext) const;
  // Plaintext centred in (-N/2, N/2].
  mpz_class DecryptSigned(const mpz_class& ciphertext) const;

  bool VerifyKeyPair() const;
  // p != q, N = p * q and both (p - 1) / 2 and (q - 1) / 2 are prime.
  bool HasBlumSafePrimes() const;

 private:
  // Allocates empty libhcs key structs.
  PaillierProvider();

  // Fills every libhcs key field from the factors, with g = N + 1.
  void LoadFactors(const mpz_class& p, const mpz_class& q);
  void Cleanup();

  pcs_public_key* pk_ = nullptr;
  pcs_private_key* sk_ = nullptr;
};

}  // namespace cggmp
