#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <gmpxx.h>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/ec_point.hpp"
#include "cggmp/crypto/scalar.hpp"

namespace cggmp {

// Fiat-Shamir transcript. Every field is absorbed with its label and length so
// two different field sequences never collide.
class Transcript {
 public:
  void append(std::string_view label, std::span<const uint8_t> data);
  void append_ascii(std::string_view label, std::string_view ascii);
  void append_proof_id(std::string_view proof_id);
  void append_session_id(std::span<const uint8_t> session_id);
  void append_u32_be(std::string_view label, uint32_t value);
  void append_mpz(std::string_view label, const mpz_class& value);
  void append_signed_mpz(std::string_view label, const mpz_class& value);
  void append_point(std::string_view label, const ECPoint& point);

  Scalar challenge_scalar_mod_q() const;
  // Challenge in [-bound, bound].
  mpz_class challenge_signed(const mpz_class& bound) const;
  // index-th challenge element reduced mod modulus.
  mpz_class challenge_mpz_mod(const mpz_class& modulus, uint32_t index) const;
  std::vector<uint8_t> challenge_bits(size_t count) const;

  const Bytes& bytes() const;

 private:
  Bytes Expand(std::string_view tag, uint32_t index, size_t out_len) const;

  Bytes transcript_;
};

}  // namespace cggmp
