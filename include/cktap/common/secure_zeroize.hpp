#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "cktap/common/bytes.hpp"

namespace cktap {

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

template <size_t N>
inline void SecureZeroize(FixedBytes<N>* value) noexcept {
  if (value == nullptr) {
    return;
  }
  SecureZeroizeMemory(value->data(), value->size());
}

template <size_t N>
inline void SecureZeroize(std::optional<FixedBytes<N>>* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (value->has_value()) {
    SecureZeroize(&value->value());
  }
  value->reset();
}

}  // namespace cktap
