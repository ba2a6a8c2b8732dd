#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "cktap/crypto/types.hpp"

namespace cktap {

struct KeyPair {
  PrivateKey priv;
  PublicKey pub;
};

// Fresh random keypair from the CSPRNG.
KeyPair GenerateKeyPair();

PublicKey PrivToPubkey(const PrivateKey& priv);

bool IsValidPublicKey(std::span<const uint8_t> compressed);

// sha256 of the compressed shared point, matching what the card computes.
Digest32 Ecdh(const PublicKey& their_pubkey, const PrivateKey& my_privkey);

CompactSignature SignCompact(const Digest32& digest, const PrivateKey& priv);

// Header byte is header_base + recovery id. 31 marks a compressed key in the
// classic message-signing encoding.
RecoverableSignature SignRecoverable(const Digest32& digest,
                                     const PrivateKey& priv,
                                     uint8_t header_base = 31);

// Accepts high-S signatures; the card is not required to normalize.
bool VerifySignature(const CompactSignature& sig,
                     const Digest32& digest,
                     const PublicKey& pubkey);

// Recovery id is (header - 27) & 3; headers outside [27, 42] are rejected.
std::optional<PublicKey> TryRecoverPubkey(const Digest32& digest, const RecoverableSignature& sig);

// Same as TryRecoverPubkey but raises SignatureRecoveryError.
PublicKey RecoverPubkey(const Digest32& digest, const RecoverableSignature& sig);

}  // namespace cktap
