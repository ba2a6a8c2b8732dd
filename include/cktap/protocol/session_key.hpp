#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "cktap/common/bytes.hpp"
#include "cktap/crypto/ecdsa.hpp"
#include "cktap/protocol/types.hpp"

namespace cktap {

// Arguments sent alongside an authenticated command.
struct AuthArgs {
  PublicKey epubkey{};
  Bytes xcvc;
};

struct XcvcResult {
  SessionKey session_key{};
  AuthArgs auth;
};

// Element-wise XOR; raises InvalidInputError on a length mismatch.
Bytes XorBytes(std::span<const uint8_t> a, std::span<const uint8_t> b);

// Picks a fresh ephemeral keypair, derives the session key by ECDH with the
// card and masks the CVC for command `cmd`.
//   session_key = sha256(ECDH(card_pubkey, ephemeral_priv))
//   mask        = (session_key ^ sha256(card_nonce || cmd))[0:len(cvc)]
//   xcvc        = cvc ^ mask
// CVC length must be 6..32 bytes.
XcvcResult CalcXcvc(std::string_view cmd,
                    const CardNonce& card_nonce,
                    const PublicKey& card_pubkey,
                    std::span<const uint8_t> cvc);

// Deterministic variant with a caller-provided ephemeral keypair. Never pass
// the same keypair for two commands.
XcvcResult CalcXcvc(std::string_view cmd,
                    const CardNonce& card_nonce,
                    const PublicKey& card_pubkey,
                    std::span<const uint8_t> cvc,
                    const KeyPair& ephemeral);

// Inverse of the masking, as the card performs it.
Bytes UnmaskXcvc(std::string_view cmd,
                 const CardNonce& card_nonce,
                 const SessionKey& session_key,
                 std::span<const uint8_t> xcvc);

}  // namespace cktap
