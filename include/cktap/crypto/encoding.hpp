#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "cktap/common/bytes.hpp"

namespace cktap {

std::string HexEncode(std::span<const uint8_t> data);

// Accepts upper or lower case; raises InvalidInputError on odd length or a
// non-hex character.
Bytes HexDecode(std::string_view hex);

// RFC 4648 alphabet, padded with '=' to a multiple of 8 characters.
std::string Base32Encode(std::span<const uint8_t> data);

// BIP-173 segwit address: hrp, '1', witness version and the program
// regrouped into 5-bit words, then the 6-character bech32 checksum.
// Only version 0 (bech32, not bech32m) is supported.
std::string EncodeSegwitAddress(std::string_view hrp,
                                uint8_t witness_version,
                                std::span<const uint8_t> program);

}  // namespace cktap
