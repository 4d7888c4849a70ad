#include "cggmp/crypto/transcript.hpp"

#include <stdexcept>

#include "cggmp/common/wire.hpp"
#include "cggmp/crypto/encoding.hpp"
#include "cggmp/crypto/hash.hpp"

namespace cggmp {
namespace {

mpz_class ImportBigEndian(std::span<const uint8_t> bytes) {
  mpz_class out;
  mpz_import(out.get_mpz_t(), bytes.size(), 1, sizeof(uint8_t), 1, 0, bytes.data());
  return out;
}

}  // namespace

void Transcript::append(std::string_view label, std::span<const uint8_t> data) {
  if (label.size() > UINT32_MAX || data.size() > UINT32_MAX) {
    throw std::invalid_argument("Transcript field exceeds uint32 length");
  }

  AppendSizedField(AsByteSpan(label), &transcript_);
  AppendSizedField(data, &transcript_);
}

void Transcript::append_ascii(std::string_view label, std::string_view ascii) {
  append(label, AsByteSpan(ascii));
}

void Transcript::append_proof_id(std::string_view proof_id) {
  append_ascii("proof_id", proof_id);
}

void Transcript::append_session_id(std::span<const uint8_t> session_id) {
  append("session_id", session_id);
}

void Transcript::append_u32_be(std::string_view label, uint32_t value) {
  Bytes encoded;
  AppendU32Be(value, &encoded);
  append(label, encoded);
}

void Transcript::append_mpz(std::string_view label, const mpz_class& value) {
  append(label, EncodeMpz(value));
}

void Transcript::append_signed_mpz(std::string_view label, const mpz_class& value) {
  append(label, EncodeSignedMpz(value));
}

void Transcript::append_point(std::string_view label, const ECPoint& point) {
  append(label, point.ToCompressedBytes());
}

Scalar Transcript::challenge_scalar_mod_q() const {
  const Bytes digest = Sha256(transcript_);
  return Scalar::FromBigEndianModQ(digest);
}

mpz_class Transcript::challenge_signed(const mpz_class& bound) const {
  if (bound <= 0) {
    throw std::invalid_argument("challenge bound must be positive");
  }

  const size_t bits = mpz_sizeinbase(bound.get_mpz_t(), 2) + 1;
  const Bytes expanded = Expand("signed", 0, (bits + 128 + 7) / 8);
  const mpz_class width = 2 * bound + 1;
  mpz_class out = ImportBigEndian(expanded) % width;
  return out - bound;
}

mpz_class Transcript::challenge_mpz_mod(const mpz_class& modulus, uint32_t index) const {
  if (modulus <= 1) {
    throw std::invalid_argument("challenge modulus must be > 1");
  }

  const size_t bits = mpz_sizeinbase(modulus.get_mpz_t(), 2);
  const Bytes expanded = Expand("mod", index, (bits + 128 + 7) / 8);
  return ImportBigEndian(expanded) % modulus;
}

std::vector<uint8_t> Transcript::challenge_bits(size_t count) const {
  const Bytes expanded = Expand("bits", 0, (count + 7) / 8);
  std::vector<uint8_t> out(count);
  for (size_t i = 0; i < count; ++i) {
    out[i] = static_cast<uint8_t>((expanded[i / 8] >> (i % 8)) & 1U);
  }
  return out;
}

const Bytes& Transcript::bytes() const {
  return transcript_;
}

// SHA-512 in counter mode over (transcript, tag, index, counter).
Bytes Transcript::Expand(std::string_view tag, uint32_t index, size_t out_len) const {
  const Bytes base = Sha512(transcript_);

  Bytes out;
  out.reserve(out_len + 64);
  uint32_t counter = 0;
  while (out.size() < out_len) {
    Bytes block;
    AppendSizedField(base, &block);
    AppendSizedField(AsByteSpan(tag), &block);
    AppendU32Be(index, &block);
    AppendU32Be(counter, &block);
    const Bytes digest = Sha512(block);
    out.insert(out.end(), digest.begin(), digest.end());
    ++counter;
  }
  out.resize(out_len);
  return out;
}

}  // namespace cggmp
