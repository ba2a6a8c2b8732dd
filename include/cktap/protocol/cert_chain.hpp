#pragma once

#include <optional>
#include <span>

#include "cktap/crypto/types.hpp"
#include "cktap/protocol/config.hpp"
#include "cktap/protocol/types.hpp"

namespace cktap {

constexpr size_t kMinCertChainLen = 2;

// Checks that the card signed our nonce with card_pubkey and that the
// certificate chain leads from card_pubkey to one of the factory roots.
// Each link is a recoverable signature over sha256 of the previous key.
//
// Raises ChainTooShortError, BadAuthSignatureError or CounterfeitDeviceError;
// any broken link fails the whole chain. Returns the matched root.
FactoryRoot VerifyCertsLowLevel(std::span<const FactoryRoot> factory_roots,
                                const CardNonce& card_nonce,
                                const PublicKey& card_pubkey,
                                const HostNonce& host_nonce,
                                std::span<const RecoverableSignature> cert_chain,
                                const CompactSignature& auth_sig,
                                const std::optional<PublicKey>& slot_pubkey = std::nullopt);

// Same, from the status/check/certs replies. The slot pubkey is ignored for
// version 0.9.0 cards, which never attest to it.
FactoryRoot VerifyCerts(std::span<const FactoryRoot> factory_roots,
                        const StatusResponse& status,
                        const CheckResponse& check,
                        const CertsResponse& certs,
                        const HostNonce& host_nonce,
                        const std::optional<PublicKey>& slot_pubkey = std::nullopt);

}  // namespace cktap
