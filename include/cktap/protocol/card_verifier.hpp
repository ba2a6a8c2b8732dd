#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "cktap/crypto/types.hpp"
#include "cktap/protocol/address.hpp"
#include "cktap/protocol/config.hpp"
#include "cktap/protocol/response_recovery.hpp"
#include "cktap/protocol/types.hpp"

namespace cktap {

// Verification entry points bound to one immutable configuration. Holds no
// mutable state, so a single instance may serve concurrent card sessions.
class CardVerifier {
 public:
  explicit CardVerifier(VerifierConfig config = VerifierConfig::Default());

  const VerifierConfig& config() const;

  FactoryRoot VerifyCerts(const StatusResponse& status,
                          const CheckResponse& check,
                          const CertsResponse& certs,
                          const HostNonce& host_nonce,
                          const std::optional<PublicKey>& slot_pubkey = std::nullopt) const;

  FactoryRoot VerifyCertsLowLevel(const CardNonce& card_nonce,
                                  const PublicKey& card_pubkey,
                                  const HostNonce& host_nonce,
                                  std::span<const RecoverableSignature> cert_chain,
                                  const CompactSignature& auth_sig,
                                  const std::optional<PublicKey>& slot_pubkey = std::nullopt) const;

  PublicKey RecoverPubkey(const StatusResponse& status,
                          const ReadResponse& read,
                          const HostNonce& host_nonce,
                          const SessionKey& session_key) const;

  RecoveredAddress RecoverAddress(const StatusResponse& status,
                                  const ReadResponse& read,
                                  const HostNonce& host_nonce) const;

  PublicKey VerifyMasterPubkey(const PublicKey& pubkey,
                               const CompactSignature& sig,
                               const ChainCode& chain_code,
                               const HostNonce& host_nonce,
                               const CardNonce& card_nonce) const;

  DerivedAddress VerifyDeriveAddress(const ChainCode& chain_code,
                                     std::span<const uint8_t> master_key) const;

  RecoverableSignature MakeRecoverableSig(const Digest32& digest,
                                          const CompactSignature& sig,
                                          std::optional<std::string_view> expected_addr,
                                          const std::optional<PublicKey>& expected_pubkey = std::nullopt) const;

  std::string RenderAddress(std::span<const uint8_t> key) const;

 private:
  const VerifierConfig config_;
};

}  // namespace cktap
