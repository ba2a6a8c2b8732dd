#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "cktap/crypto/types.hpp"
#include "cktap/protocol/bip32_path.hpp"
#include "cktap/protocol/types.hpp"

namespace cktap {

struct DerivedKey {
  ChainCode chain_code{};
  PublicKey pubkey{};
  // Set only when the parent was a private key.
  std::optional<PrivateKey> privkey;
};

// One BIP-32 CKD step. parent_key is either a 33-byte compressed public key
// or a 32-byte private key; hardened indices need the private key.
DerivedKey Bip32DeriveChild(const ChainCode& chain_code,
                            std::span<const uint8_t> parent_key,
                            uint32_t index);

DerivedKey Bip32DerivePath(const ChainCode& chain_code,
                           std::span<const uint8_t> master_key,
                           const DerivationPath& path);

}  // namespace cktap
