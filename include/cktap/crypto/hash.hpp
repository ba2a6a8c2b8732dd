#pragma once

#include <span>

#include "cktap/common/bytes.hpp"
#include "cktap/crypto/types.hpp"

namespace cktap {

Digest32 Sha256(std::span<const uint8_t> data);
Hash160Digest Ripemd160(std::span<const uint8_t> data);

// RIPEMD160(SHA256(data)), the address hash of a public key.
Hash160Digest Hash160(std::span<const uint8_t> data);

FixedBytes<64> HmacSha512(std::span<const uint8_t> key, std::span<const uint8_t> data);

}  // namespace cktap
