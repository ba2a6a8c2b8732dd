#pragma once

#include <cstddef>
#include <string>

#include "cktap/crypto/types.hpp"
#include "cktap/protocol/types.hpp"

namespace cktap {

struct RecoveredAddress {
  PublicKey pubkey{};
  std::string address;
};

// TAPSIGNER "read": the pubkey arrives with bytes 1..32 XOR-masked by the
// session key. Unmasks it and checks the card signed
// prefix || card_nonce || host_nonce || 0x00 with it.
// Raises WrongDeviceTypeError or ProofOfPossessionError.
PublicKey RecoverPubkeyFromRead(const StatusResponse& status,
                                const ReadResponse& read,
                                const HostNonce& host_nonce,
                                const SessionKey& session_key);

// SATSCARD "read": checks the card signed the nonce message bound to its
// active slot, then compares the rendered address with the redacted one
// from "status" ("bc1qxxxxxxxxxx_..._yyyyyyyyyyyy"). The revealed prefix and
// suffix must both be exactly addr_trim characters and match.
// Raises WrongDeviceTypeError, FramingError, ProofOfPossessionError or
// CounterfeitDeviceError.
RecoveredAddress RecoverAddressFromRead(const StatusResponse& status,
                                        const ReadResponse& read,
                                        const HostNonce& host_nonce,
                                        size_t addr_trim = kDefaultAddrTrim,
                                        bool testnet = false);

// "derive" reply: the card signs prefix || card_nonce || host_nonce ||
// chain_code with the slot's master pubkey.
PublicKey VerifyMasterPubkey(const PublicKey& pubkey,
                             const CompactSignature& sig,
                             const ChainCode& chain_code,
                             const HostNonce& host_nonce,
                             const CardNonce& card_nonce);

}  // namespace cktap
