#pragma once

#include <cstddef>
#include <span>

#include "cktap/common/bytes.hpp"
#include "cktap/crypto/scalar.hpp"

namespace cktap {

class Csprng {
 public:
  static Bytes RandomBytes(size_t size);
  static void Fill(std::span<uint8_t> out);

  // Uniform in [1, q-1].
  static Scalar RandomNonZeroScalar();
};

}  // namespace cktap
