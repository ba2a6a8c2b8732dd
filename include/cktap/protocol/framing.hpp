#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "cktap/common/bytes.hpp"
#include "cktap/protocol/types.hpp"

namespace cktap {

// Domain separation prefix of every message the card signs.
constexpr std::string_view kSigningPrefix = "OPENDIME";

// prefix || card_nonce || host_nonce || context
//
// Raises FramingError unless the result is exactly
// 8 + 16 + 16 + expected_context_len bytes.
Bytes BuildSigningMessage(std::span<const uint8_t> card_nonce,
                          std::span<const uint8_t> host_nonce,
                          std::span<const uint8_t> context,
                          size_t expected_context_len);

Bytes FrameMessage(const CardNonce& card_nonce, const HostNonce& host_nonce);
Bytes FrameMessage(const CardNonce& card_nonce, const HostNonce& host_nonce, uint8_t slot_index);
Bytes FrameMessage(const CardNonce& card_nonce, const HostNonce& host_nonce, const PublicKey& slot_pubkey);
Bytes FrameMessage(const CardNonce& card_nonce, const HostNonce& host_nonce, const ChainCode& chain_code);

}  // namespace cktap
