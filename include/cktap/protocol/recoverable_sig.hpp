#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "cktap/crypto/types.hpp"

namespace cktap {

// BIP-137 header for P2WPKH signatures; the header byte is this plus the
// recovery id.
constexpr uint8_t kSegwitRecoveryHeader = 39;
constexpr int kMaxRecoveryId = 4;

// The card only produces 64-byte signatures. Tries every recovery id and
// returns the 65-byte form whose recovered key equals expected_pubkey (if
// given) and renders to an address ending with expected_addr (if given).
// With neither constraint the first recoverable candidate wins.
// Raises SignatureRecoveryError when no candidate satisfies the constraints.
RecoverableSignature MakeRecoverableSig(const Digest32& digest,
                                        const CompactSignature& sig,
                                        std::optional<std::string_view> expected_addr = std::nullopt,
                                        const std::optional<PublicKey>& expected_pubkey = std::nullopt,
                                        bool testnet = false);

}  // namespace cktap
