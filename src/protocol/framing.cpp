#include "cktap/protocol/framing.hpp"

#include <string>

#include "cktap/common/errors.hpp"

namespace cktap {

Bytes BuildSigningMessage(std::span<const uint8_t> card_nonce,
                          std::span<const uint8_t> host_nonce,
                          std::span<const uint8_t> context,
                          size_t expected_context_len) {
  if (card_nonce.size() != kCardNonceLen) {
    throw FramingError("card nonce must be 16 bytes");
  }
  if (host_nonce.size() != kHostNonceLen) {
    throw FramingError("host nonce must be 16 bytes");
  }

  const size_t expected_len = kSigningPrefix.size() + kCardNonceLen + kHostNonceLen + expected_context_len;

  Bytes msg;
  msg.reserve(expected_len);
  Append(AsByteSpan(kSigningPrefix), &msg);
  Append(card_nonce, &msg);
  Append(host_nonce, &msg);
  Append(context, &msg);

  if (msg.size() != expected_len) {
    throw FramingError("signing message is " + std::to_string(msg.size()) + " bytes, expected " +
                       std::to_string(expected_len));
  }
  return msg;
}

Bytes FrameMessage(const CardNonce& card_nonce, const HostNonce& host_nonce) {
  return BuildSigningMessage(card_nonce, host_nonce, {}, 0);
}

Bytes FrameMessage(const CardNonce& card_nonce, const HostNonce& host_nonce, uint8_t slot_index) {
  const uint8_t context[1] = {slot_index};
  return BuildSigningMessage(card_nonce, host_nonce, context, 1);
}

Bytes FrameMessage(const CardNonce& card_nonce, const HostNonce& host_nonce, const PublicKey& slot_pubkey) {
  return BuildSigningMessage(card_nonce, host_nonce, slot_pubkey, kPublicKeyLen);
}

Bytes FrameMessage(const CardNonce& card_nonce, const HostNonce& host_nonce, const ChainCode& chain_code) {
  return BuildSigningMessage(card_nonce, host_nonce, chain_code, kChainCodeLen);
}

}  // namespace cktap
