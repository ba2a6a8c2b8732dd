#include "cktap/protocol/cert_chain.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "cktap/common/errors.hpp"
#include "cktap/crypto/ecdsa.hpp"
#include "cktap/crypto/encoding.hpp"
#include "cktap/crypto/hash.hpp"
#include "cktap/protocol/framing.hpp"

namespace cktap {

FactoryRoot VerifyCertsLowLevel(std::span<const FactoryRoot> factory_roots,
                                const CardNonce& card_nonce,
                                const PublicKey& card_pubkey,
                                const HostNonce& host_nonce,
                                std::span<const RecoverableSignature> cert_chain,
                                const CompactSignature& auth_sig,
                                const std::optional<PublicKey>& slot_pubkey) {
  if (cert_chain.size() < kMinCertChainLen) {
    throw ChainTooShortError("certificate chain needs at least 2 links, got " +
                             std::to_string(cert_chain.size()));
  }

  // v1.0.0+ SATSCARD binds the sealed slot's pubkey into the message
  const Bytes msg = slot_pubkey.has_value() ? FrameMessage(card_nonce, host_nonce, *slot_pubkey)
                                            : FrameMessage(card_nonce, host_nonce);

  if (!VerifySignature(auth_sig, Sha256(msg), card_pubkey)) {
    SPDLOG_WARN("card {} failed to sign the certs challenge", HexEncode(card_pubkey));
    throw BadAuthSignatureError("bad signature when verifying certificates");
  }

  PublicKey pubkey = card_pubkey;
  for (size_t depth = 0; depth < cert_chain.size(); ++depth) {
    const auto signer = TryRecoverPubkey(Sha256(pubkey), cert_chain[depth]);
    if (!signer.has_value()) {
      SPDLOG_WARN("certificate link {} does not recover to a key", depth);
      throw CounterfeitDeviceError("certificate chain is broken at link " + std::to_string(depth));
    }
    SPDLOG_DEBUG("certificate link {} signed by {}", depth, HexEncode(*signer));
    pubkey = *signer;
  }

  const auto root = std::find_if(factory_roots.begin(), factory_roots.end(),
                                 [&](const FactoryRoot& candidate) { return candidate.key == pubkey; });
  if (root == factory_roots.end()) {
    SPDLOG_WARN("root cert {} is not a factory key, card {} is counterfeit", HexEncode(pubkey),
                HexEncode(card_pubkey));
    throw CounterfeitDeviceError("root cert is not from the factory, card is counterfeit");
  }

  SPDLOG_INFO("root cert matches \"{}\", card is genuine", root->label);
  return *root;
}

FactoryRoot VerifyCerts(std::span<const FactoryRoot> factory_roots,
                        const StatusResponse& status,
                        const CheckResponse& check,
                        const CertsResponse& certs,
                        const HostNonce& host_nonce,
                        const std::optional<PublicKey>& slot_pubkey) {
  std::optional<PublicKey> attested = slot_pubkey;
  if (status.version == kLegacyCertsVersion) {
    attested.reset();
  }

  return VerifyCertsLowLevel(factory_roots, status.card_nonce, status.pubkey, host_nonce,
                             certs.cert_chain, check.auth_sig, attested);
}

}  // namespace cktap
