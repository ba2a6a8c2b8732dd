#include "cktap/crypto/ecdsa.hpp"

#include <stdexcept>

extern "C" {
#include <secp256k1_ecdh.h>
#include <secp256k1_recovery.h>
}

#include "cktap/common/errors.hpp"
#include "cktap/crypto/ec_point.hpp"
#include "cktap/crypto/random.hpp"
#include "crypto/internal/secp_context.hpp"

namespace cktap {
namespace {

using internal::GetSecpContext;

constexpr uint8_t kMinRecoveryHeader = 27;
constexpr uint8_t kMaxRecoveryHeader = 42;

std::optional<secp256k1_pubkey> ParsePubkey(std::span<const uint8_t> compressed) {
  if (compressed.size() != kPublicKeyLen) {
    return std::nullopt;
  }
  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_parse(GetSecpContext(), &pubkey, compressed.data(), compressed.size()) != 1) {
    return std::nullopt;
  }
  return pubkey;
}

PublicKey SerializeCompressed(const secp256k1_pubkey& pubkey) {
  PublicKey out{};
  size_t out_len = out.size();
  if (secp256k1_ec_pubkey_serialize(
          GetSecpContext(), out.data(), &out_len, &pubkey, SECP256K1_EC_COMPRESSED) != 1 ||
      out_len != out.size()) {
    throw std::runtime_error("Failed to serialize secp256k1 point");
  }
  return out;
}

}  // namespace

KeyPair GenerateKeyPair() {
  const Scalar secret = Csprng::RandomNonZeroScalar();

  KeyPair out;
  out.priv = secret.ToCanonicalBytes();
  out.pub = ECPoint::GeneratorMultiply(secret).compressed();
  return out;
}

PublicKey PrivToPubkey(const PrivateKey& priv) {
  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_create(GetSecpContext(), &pubkey, priv.data()) != 1) {
    throw InvalidInputError("private key must be in [1, q-1]");
  }
  return SerializeCompressed(pubkey);
}

bool IsValidPublicKey(std::span<const uint8_t> compressed) {
  return ParsePubkey(compressed).has_value();
}

Digest32 Ecdh(const PublicKey& their_pubkey, const PrivateKey& my_privkey) {
  const auto pubkey = ParsePubkey(their_pubkey);
  if (!pubkey.has_value()) {
    throw InvalidInputError("ECDH peer key is not a valid secp256k1 point");
  }

  // default hash function is sha256(0x02|0x03 || x), the compressed shared point
  Digest32 out{};
  if (secp256k1_ecdh(GetSecpContext(), out.data(), &*pubkey, my_privkey.data(), nullptr, nullptr) != 1) {
    throw InvalidInputError("ECDH failed: private key out of range");
  }
  return out;
}

CompactSignature SignCompact(const Digest32& digest, const PrivateKey& priv) {
  secp256k1_ecdsa_signature sig;
  if (secp256k1_ecdsa_sign(GetSecpContext(), &sig, digest.data(), priv.data(), nullptr, nullptr) != 1) {
    throw InvalidInputError("ECDSA signing failed: private key out of range");
  }

  CompactSignature out{};
  if (secp256k1_ecdsa_signature_serialize_compact(GetSecpContext(), out.data(), &sig) != 1) {
    throw std::runtime_error("Failed to serialize ECDSA signature");
  }
  return out;
}

RecoverableSignature SignRecoverable(const Digest32& digest,
                                     const PrivateKey& priv,
                                     uint8_t header_base) {
  secp256k1_ecdsa_recoverable_signature sig;
  if (secp256k1_ecdsa_sign_recoverable(
          GetSecpContext(), &sig, digest.data(), priv.data(), nullptr, nullptr) != 1) {
    throw InvalidInputError("ECDSA signing failed: private key out of range");
  }

  RecoverableSignature out{};
  int rec_id = 0;
  if (secp256k1_ecdsa_recoverable_signature_serialize_compact(
          GetSecpContext(), out.data() + 1, &rec_id, &sig) != 1) {
    throw std::runtime_error("Failed to serialize recoverable signature");
  }
  out[0] = static_cast<uint8_t>(header_base + rec_id);
  return out;
}

bool VerifySignature(const CompactSignature& sig,
                     const Digest32& digest,
                     const PublicKey& pubkey) {
  const auto parsed_key = ParsePubkey(pubkey);
  if (!parsed_key.has_value()) {
    return false;
  }

  secp256k1_ecdsa_signature parsed_sig;
  if (secp256k1_ecdsa_signature_parse_compact(GetSecpContext(), &parsed_sig, sig.data()) != 1) {
    return false;
  }
  secp256k1_ecdsa_signature_normalize(GetSecpContext(), &parsed_sig, &parsed_sig);

  return secp256k1_ecdsa_verify(GetSecpContext(), &parsed_sig, digest.data(), &*parsed_key) == 1;
}

std::optional<PublicKey> TryRecoverPubkey(const Digest32& digest, const RecoverableSignature& sig) {
  const uint8_t header = sig[0];
  if (header < kMinRecoveryHeader || header > kMaxRecoveryHeader) {
    return std::nullopt;
  }
  const int rec_id = (header - kMinRecoveryHeader) & 0x03;

  secp256k1_ecdsa_recoverable_signature parsed;
  if (secp256k1_ecdsa_recoverable_signature_parse_compact(
          GetSecpContext(), &parsed, sig.data() + 1, rec_id) != 1) {
    return std::nullopt;
  }

  secp256k1_pubkey pubkey;
  if (secp256k1_ecdsa_recover(GetSecpContext(), &pubkey, &parsed, digest.data()) != 1) {
    return std::nullopt;
  }
  return SerializeCompressed(pubkey);
}

PublicKey RecoverPubkey(const Digest32& digest, const RecoverableSignature& sig) {
  auto recovered = TryRecoverPubkey(digest, sig);
  if (!recovered.has_value()) {
    throw SignatureRecoveryError("signature does not recover to a public key");
  }
  return *recovered;
}

}  // namespace cktap
