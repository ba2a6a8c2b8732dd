#include "cktap/protocol/card_verifier.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "cktap/common/errors.hpp"
#include "cktap/crypto/ecdsa.hpp"
#include "cktap/protocol/cert_chain.hpp"
#include "cktap/protocol/recoverable_sig.hpp"

namespace cktap {
namespace {

VerifierConfig ValidateConfig(VerifierConfig config) {
  if (config.factory_roots.empty()) {
    throw InvalidInputError("at least one factory root key is required");
  }
  for (const FactoryRoot& root : config.factory_roots) {
    if (!IsValidPublicKey(root.key)) {
      throw InvalidInputError("factory root \"" + root.label + "\" is not a valid point");
    }
  }
  if (config.addr_trim == 0) {
    throw InvalidInputError("address trim length must be positive");
  }
  return config;
}

}  // namespace

CardVerifier::CardVerifier(VerifierConfig config) : config_(ValidateConfig(std::move(config))) {
  SPDLOG_DEBUG("card verifier trusts {} factory root(s), {}", config_.factory_roots.size(),
               config_.testnet ? "testnet" : "mainnet");
}

const VerifierConfig& CardVerifier::config() const {
  return config_;
}

FactoryRoot CardVerifier::VerifyCerts(const StatusResponse& status,
                                      const CheckResponse& check,
                                      const CertsResponse& certs,
                                      const HostNonce& host_nonce,
                                      const std::optional<PublicKey>& slot_pubkey) const {
  return cktap::VerifyCerts(config_.factory_roots, status, check, certs, host_nonce, slot_pubkey);
}

FactoryRoot CardVerifier::VerifyCertsLowLevel(const CardNonce& card_nonce,
                                              const PublicKey& card_pubkey,
                                              const HostNonce& host_nonce,
                                              std::span<const RecoverableSignature> cert_chain,
                                              const CompactSignature& auth_sig,
                                              const std::optional<PublicKey>& slot_pubkey) const {
  return cktap::VerifyCertsLowLevel(config_.factory_roots, card_nonce, card_pubkey, host_nonce,
                                    cert_chain, auth_sig, slot_pubkey);
}

PublicKey CardVerifier::RecoverPubkey(const StatusResponse& status,
                                      const ReadResponse& read,
                                      const HostNonce& host_nonce,
                                      const SessionKey& session_key) const {
  return RecoverPubkeyFromRead(status, read, host_nonce, session_key);
}

RecoveredAddress CardVerifier::RecoverAddress(const StatusResponse& status,
                                              const ReadResponse& read,
                                              const HostNonce& host_nonce) const {
  return RecoverAddressFromRead(status, read, host_nonce, config_.addr_trim, config_.testnet);
}

PublicKey CardVerifier::VerifyMasterPubkey(const PublicKey& pubkey,
                                           const CompactSignature& sig,
                                           const ChainCode& chain_code,
                                           const HostNonce& host_nonce,
                                           const CardNonce& card_nonce) const {
  return cktap::VerifyMasterPubkey(pubkey, sig, chain_code, host_nonce, card_nonce);
}

DerivedAddress CardVerifier::VerifyDeriveAddress(const ChainCode& chain_code,
                                                 std::span<const uint8_t> master_key) const {
  return cktap::VerifyDeriveAddress(chain_code, master_key, config_.testnet);
}

RecoverableSignature CardVerifier::MakeRecoverableSig(const Digest32& digest,
                                                      const CompactSignature& sig,
                                                      std::optional<std::string_view> expected_addr,
                                                      const std::optional<PublicKey>& expected_pubkey) const {
  return cktap::MakeRecoverableSig(digest, sig, expected_addr, expected_pubkey, config_.testnet);
}

std::string CardVerifier::RenderAddress(std::span<const uint8_t> key) const {
  return cktap::RenderAddress(key, config_.testnet);
}

}  // namespace cktap
