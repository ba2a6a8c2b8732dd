#pragma once

#include <cstdint>
#include <span>

#include "cktap/crypto/scalar.hpp"
#include "cktap/crypto/types.hpp"

namespace cktap {

class ECPoint {
 public:
  ECPoint();

  static ECPoint FromCompressed(std::span<const uint8_t> compressed_bytes);
  static ECPoint GeneratorMultiply(const Scalar& scalar);

  ECPoint Add(const ECPoint& other) const;

  const PublicKey& compressed() const;

  bool operator==(const ECPoint& other) const;
  bool operator!=(const ECPoint& other) const;

 private:
  PublicKey compressed_{};
};

}  // namespace cktap
