#pragma once

#include <cstdint>
#include <span>
#include <string>

#include "cktap/crypto/types.hpp"
#include "cktap/protocol/types.hpp"

namespace cktap {

struct DerivedAddress {
  std::string address;
  PublicKey pubkey{};
};

// P2WPKH bech32 address ("bc1q..." or "tb1q..."). A 32-byte key is taken as
// a private key and converted to its public key first.
std::string RenderAddress(std::span<const uint8_t> key, bool testnet = false);

// Human-readable card fingerprint, e.g. "ABCDE-FGHIJ-KLMNO-PQRST".
// base32(sha256(pubkey)[8:]) keeps the first 20 characters; the leading 8
// bytes of the hash are already public in the card's NFC URL.
std::string CardPubkeyToIdent(std::span<const uint8_t> card_pubkey);

// Re-derives the address the card should report for m/0 of a slot. Accepts
// the master public key (before unseal) or private key (after).
DerivedAddress VerifyDeriveAddress(const ChainCode& chain_code,
                                   std::span<const uint8_t> master_key,
                                   bool testnet = false);

}  // namespace cktap
