#pragma once

#include <array>
#include <cstdint>
#include <span>

#include <gmpxx.h>

namespace cktap {

// Integer modulo the secp256k1 group order.
class Scalar {
 public:
  Scalar();
  explicit Scalar(const mpz_class& value);

  static Scalar FromUint64(uint64_t value);

  // Rejects anything that is not exactly 32 bytes or is >= q.
  static Scalar FromCanonicalBytes(std::span<const uint8_t> bytes);

  std::array<uint8_t, 32> ToCanonicalBytes() const;

  bool IsZero() const;

  Scalar operator+(const Scalar& other) const;

  bool operator==(const Scalar& other) const;
  bool operator!=(const Scalar& other) const;

  static const mpz_class& ModulusQ();

 private:
  mpz_class value_;
};

}  // namespace cktap
