#include "cktap/crypto/random.hpp"

#include <stdexcept>

#include <openssl/rand.h>

#include "cktap/common/secure_zeroize.hpp"

namespace cktap {

Bytes Csprng::RandomBytes(size_t size) {
  Bytes out(size);
  Fill(out);
  return out;
}

void Csprng::Fill(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }

  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
}

Scalar Csprng::RandomNonZeroScalar() {
  while (true) {
    FixedBytes<32> bytes{};
    Fill(bytes);
    try {
      Scalar candidate = Scalar::FromCanonicalBytes(bytes);
      SecureZeroize(&bytes);
      if (!candidate.IsZero()) {
        return candidate;
      }
    } catch (const std::invalid_argument&) {
      SecureZeroize(&bytes);
      continue;
    }
  }
}

}  // namespace cktap
