#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "cktap/crypto/ecdsa.hpp"
#include "cktap/crypto/hash.hpp"
#include "cktap/protocol/address.hpp"
#include "cktap/protocol/config.hpp"
#include "cktap/protocol/framing.hpp"
#include "cktap/protocol/session_key.hpp"
#include "cktap/protocol/types.hpp"

namespace cktap::testing {

inline PrivateKey FilledKey(uint8_t value) {
  PrivateKey out{};
  out.fill(value);
  return out;
}

inline KeyPair KeyPairFrom(uint8_t fill) {
  KeyPair out;
  out.priv = FilledKey(fill);
  out.pub = PrivToPubkey(out.priv);
  return out;
}

inline CardNonce FixedCardNonce() {
  CardNonce out{};
  for (size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(0xA0 + i);
  }
  return out;
}

inline HostNonce FixedHostNonce() {
  HostNonce out{};
  for (size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(i + 1);
  }
  return out;
}

// Software stand-in for a card: a factory root certifies a batch key, which
// certifies the card key. Signatures are real secp256k1 signatures.
class FakeCard {
 public:
  explicit FakeCard(bool is_tapsigner)
      : root_(KeyPairFrom(0x11)),
        batch_(KeyPairFrom(0x22)),
        card_(KeyPairFrom(0x33)),
        slot_(KeyPairFrom(0x44)),
        is_tapsigner_(is_tapsigner) {
    chain_code_.fill(0x55);
    cert_chain_.push_back(SignRecoverable(Sha256(card_.pub), batch_.priv));
    cert_chain_.push_back(SignRecoverable(Sha256(batch_.pub), root_.priv));
  }

  const KeyPair& root() const { return root_; }
  const KeyPair& card() const { return card_; }
  const KeyPair& slot() const { return slot_; }
  const ChainCode& chain_code() const { return chain_code_; }

  VerifierConfig Config() const {
    VerifierConfig config;
    config.factory_roots.push_back(FactoryRoot{root_.pub, "Test Root"});
    return config;
  }

  StatusResponse Status() const {
    StatusResponse status;
    status.version = "1.0.3";
    status.card_nonce = card_nonce_;
    status.pubkey = card_.pub;
    status.is_tapsigner = is_tapsigner_;
    if (!is_tapsigner_) {
      status.slots = SlotInfo{slot_index_, 10};
      const std::string addr = RenderAddress(slot_.pub);
      status.addr = addr.substr(0, kDefaultAddrTrim) + "___" + addr.substr(addr.size() - kDefaultAddrTrim);
    }
    return status;
  }

  CertsResponse Certs() const {
    CertsResponse certs;
    certs.cert_chain = cert_chain_;
    return certs;
  }

  CheckResponse Check(const HostNonce& host_nonce,
                      const std::optional<PublicKey>& slot_pubkey = std::nullopt) const {
    const Bytes msg = slot_pubkey.has_value() ? FrameMessage(card_nonce_, host_nonce, *slot_pubkey)
                                              : FrameMessage(card_nonce_, host_nonce);
    CheckResponse out;
    out.auth_sig = SignCompact(Sha256(msg), card_.priv);
    return out;
  }

  // TAPSIGNER read: pubkey masked with the session key the card derives
  // from the host's ephemeral pubkey.
  ReadResponse TapsignerRead(const HostNonce& host_nonce, const PublicKey& epubkey) const {
    const SessionKey session_key = Ecdh(epubkey, card_.priv);
    const Bytes msg = FrameMessage(card_nonce_, host_nonce, static_cast<uint8_t>(0));

    ReadResponse out;
    out.pubkey = slot_.pub;
    for (size_t i = 1; i < out.pubkey.size(); ++i) {
      out.pubkey[i] ^= session_key[i - 1];
    }
    out.sig = SignCompact(Sha256(msg), slot_.priv);
    return out;
  }

  ReadResponse SatscardRead(const HostNonce& host_nonce) const {
    const Bytes msg = FrameMessage(card_nonce_, host_nonce, slot_index_);

    ReadResponse out;
    out.pubkey = slot_.pub;
    out.sig = SignCompact(Sha256(msg), slot_.priv);
    return out;
  }

  // "derive" reply for a slot whose master key is slot_.
  CompactSignature DeriveSig(const HostNonce& host_nonce) const {
    const Bytes msg = FrameMessage(card_nonce_, host_nonce, chain_code_);
    return SignCompact(Sha256(msg), slot_.priv);
  }

 private:
  KeyPair root_;
  KeyPair batch_;
  KeyPair card_;
  KeyPair slot_;
  bool is_tapsigner_;
  uint8_t slot_index_ = 3;
  CardNonce card_nonce_ = FixedCardNonce();
  ChainCode chain_code_{};
  std::vector<RecoverableSignature> cert_chain_;
};

}  // namespace cktap::testing
