#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace cktap {

using Bytes = std::vector<uint8_t>;

template <size_t N>
using FixedBytes = std::array<uint8_t, N>;

inline std::span<const uint8_t> AsByteSpan(std::string_view value) {
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

inline void Append(std::span<const uint8_t> data, Bytes* out) {
  out->insert(out->end(), data.begin(), data.end());
}

}  // namespace cktap
