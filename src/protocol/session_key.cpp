#include "cktap/protocol/session_key.hpp"

#include <string>

#include "cktap/common/errors.hpp"
#include "cktap/common/secure_zeroize.hpp"
#include "cktap/crypto/hash.hpp"

namespace cktap {
namespace {

void ValidateCommand(std::string_view cmd) {
  if (cmd.empty()) {
    throw InvalidInputError("command name must not be empty");
  }
  for (char c : cmd) {
    if (static_cast<unsigned char>(c) < 0x20 || static_cast<unsigned char>(c) > 0x7e) {
      throw InvalidInputError("command name must be printable ASCII");
    }
  }
}

void ValidateCvcLength(size_t len) {
  if (len < kMinCvcLen || len > kMaxCvcLen) {
    throw InvalidInputError("CVC must be " + std::to_string(kMinCvcLen) + " to " +
                            std::to_string(kMaxCvcLen) + " bytes, got " + std::to_string(len));
  }
}

Bytes BuildMask(std::string_view cmd,
                const CardNonce& card_nonce,
                const SessionKey& session_key,
                size_t len) {
  Bytes message;
  message.reserve(card_nonce.size() + cmd.size());
  Append(card_nonce, &message);
  Append(AsByteSpan(cmd), &message);
  const Digest32 md = Sha256(message);

  Bytes mask = XorBytes(session_key, md);
  mask.resize(len);
  return mask;
}

}  // namespace

Bytes XorBytes(std::span<const uint8_t> a, std::span<const uint8_t> b) {
  if (a.size() != b.size()) {
    throw InvalidInputError("XorBytes length mismatch: " + std::to_string(a.size()) + " vs " +
                            std::to_string(b.size()));
  }

  Bytes out(a.size());
  for (size_t i = 0; i < a.size(); ++i) {
    out[i] = a[i] ^ b[i];
  }
  return out;
}

XcvcResult CalcXcvc(std::string_view cmd,
                    const CardNonce& card_nonce,
                    const PublicKey& card_pubkey,
                    std::span<const uint8_t> cvc) {
  ValidateCvcLength(cvc.size());
  KeyPair ephemeral = GenerateKeyPair();
  XcvcResult out = CalcXcvc(cmd, card_nonce, card_pubkey, cvc, ephemeral);
  SecureZeroize(&ephemeral.priv);
  return out;
}

XcvcResult CalcXcvc(std::string_view cmd,
                    const CardNonce& card_nonce,
                    const PublicKey& card_pubkey,
                    std::span<const uint8_t> cvc,
                    const KeyPair& ephemeral) {
  ValidateCommand(cmd);
  ValidateCvcLength(cvc.size());

  XcvcResult out;
  out.session_key = Ecdh(card_pubkey, ephemeral.priv);

  Bytes mask = BuildMask(cmd, card_nonce, out.session_key, cvc.size());
  out.auth.epubkey = ephemeral.pub;
  out.auth.xcvc = XorBytes(cvc, mask);
  SecureZeroize(&mask);
  return out;
}

Bytes UnmaskXcvc(std::string_view cmd,
                 const CardNonce& card_nonce,
                 const SessionKey& session_key,
                 std::span<const uint8_t> xcvc) {
  ValidateCommand(cmd);
  ValidateCvcLength(xcvc.size());

  Bytes mask = BuildMask(cmd, card_nonce, session_key, xcvc.size());
  Bytes cvc = XorBytes(xcvc, mask);
  SecureZeroize(&mask);
  return cvc;
}

}  // namespace cktap
