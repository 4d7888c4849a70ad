#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include <gmpxx.h>

#include "cggmp/common/bytes.hpp"
#include "cggmp/crypto/scalar.hpp"

namespace cggmp {

inline void SecureZeroizeMemory(void* data, size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }

  volatile uint8_t* ptr = static_cast<volatile uint8_t*>(data);
  while (size > 0) {
    *ptr = 0;
    ++ptr;
    --size;
  }
}

inline void SecureZeroize(Bytes* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (!value->empty()) {
    SecureZeroizeMemory(value->data(), value->size());
  }
  value->clear();
}

// Overwrites the allocated limbs, not just the used ones.
inline void SecureZeroize(mpz_class* value) noexcept {
  if (value == nullptr) {
    return;
  }
  mpz_ptr raw = value->get_mpz_t();
  if (raw->_mp_d != nullptr && raw->_mp_alloc > 0) {
    SecureZeroizeMemory(raw->_mp_d, static_cast<size_t>(raw->_mp_alloc) * sizeof(mp_limb_t));
  }
  raw->_mp_size = 0;
}

inline void SecureZeroize(Scalar* value) noexcept {
  if (value == nullptr) {
    return;
  }
  value->Zeroize();
}

inline void SecureZeroize(std::optional<Scalar>* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (value->has_value()) {
    SecureZeroize(&value->value());
  }
  value->reset();
}

inline void SecureZeroize(std::vector<Scalar>* values) noexcept {
  if (values == nullptr) {
    return;
  }
  for (Scalar& value : *values) {
    SecureZeroize(&value);
  }
  values->clear();
}

template <typename K>
inline void SecureZeroize(std::unordered_map<K, Scalar>* values) noexcept {
  if (values == nullptr) {
    return;
  }
  for (auto& [key, value] : *values) {
    (void)key;
    SecureZeroize(&value);
  }
  values->clear();
}

template <typename K>
inline void SecureZeroize(std::unordered_map<K, mpz_class>* values) noexcept {
  if (values == nullptr) {
    return;
  }
  for (auto& [key, value] : *values) {
    (void)key;
    SecureZeroize(&value);
  }
  values->clear();
}

// Zeroizes the guarded object when the scope ends.
template <typename T>
class ScopedZeroize {
 public:
  explicit ScopedZeroize(T* target) noexcept : target_(target) {}
  ~ScopedZeroize() { SecureZeroize(target_); }

  ScopedZeroize(const ScopedZeroize&) = delete;
  ScopedZeroize& operator=(const ScopedZeroize&) = delete;

 private:
  T* target_;
};

}  // namespace cggmp
