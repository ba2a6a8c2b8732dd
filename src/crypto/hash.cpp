#include "cktap/crypto/hash.hpp"

#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/ripemd.h>
#include <openssl/sha.h>

namespace cktap {

Digest32 Sha256(std::span<const uint8_t> data) {
  Digest32 digest{};
  if (SHA256(data.data(), data.size(), digest.data()) == nullptr) {
    throw std::runtime_error("SHA256 failed");
  }
  return digest;
}

Hash160Digest Ripemd160(std::span<const uint8_t> data) {
  Hash160Digest digest{};
  if (RIPEMD160(data.data(), data.size(), digest.data()) == nullptr) {
    throw std::runtime_error("RIPEMD160 failed");
  }
  return digest;
}

Hash160Digest Hash160(std::span<const uint8_t> data) {
  const Digest32 inner = Sha256(data);
  return Ripemd160(inner);
}

FixedBytes<64> HmacSha512(std::span<const uint8_t> key, std::span<const uint8_t> data) {
  FixedBytes<64> out{};
  unsigned int out_len = 0;
  if (HMAC(EVP_sha512(), key.data(), static_cast<int>(key.size()), data.data(), data.size(),
           out.data(), &out_len) == nullptr ||
      out_len != out.size()) {
    throw std::runtime_error("HMAC-SHA512 failed");
  }
  return out;
}

}  // namespace cktap
