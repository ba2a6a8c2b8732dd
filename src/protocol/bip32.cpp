#include "cktap/protocol/bip32.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <utility>

#include "cktap/common/errors.hpp"
#include "cktap/common/secure_zeroize.hpp"
#include "cktap/crypto/ec_point.hpp"
#include "cktap/crypto/ecdsa.hpp"
#include "cktap/crypto/hash.hpp"
#include "cktap/crypto/scalar.hpp"

namespace cktap {
namespace {

void AppendU32Be(uint32_t value, Bytes* out) {
  out->push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<uint8_t>(value & 0xFF));
}

Scalar ParsePrivateKey(std::span<const uint8_t> key) {
  try {
    Scalar out = Scalar::FromCanonicalBytes(key);
    if (out.IsZero()) {
      throw InvalidInputError("bip32 private key must not be zero");
    }
    return out;
  } catch (const InvalidInputError&) {
    throw;
  } catch (const std::invalid_argument& ex) {
    throw InvalidInputError(std::string("bip32 private key: ") + ex.what());
  }
}

}  // namespace

DerivedKey Bip32DeriveChild(const ChainCode& chain_code,
                            std::span<const uint8_t> parent_key,
                            uint32_t index) {
  const bool hardened = (index & kHardenedBit) != 0;

  std::optional<Scalar> parent_priv;
  PublicKey parent_pub{};
  if (parent_key.size() == kPrivateKeyLen) {
    parent_priv = ParsePrivateKey(parent_key);
    parent_pub = ECPoint::GeneratorMultiply(*parent_priv).compressed();
  } else if (parent_key.size() == kPublicKeyLen) {
    if (!IsValidPublicKey(parent_key)) {
      throw InvalidInputError("bip32 parent public key is not a valid point");
    }
    std::copy(parent_key.begin(), parent_key.end(), parent_pub.begin());
  } else {
    throw InvalidInputError("bip32 parent key must be 32 (private) or 33 (public) bytes");
  }

  if (hardened && !parent_priv.has_value()) {
    throw InvalidInputError("hardened derivation requires a private parent key");
  }

  Bytes data;
  data.reserve(37);
  if (hardened) {
    // 0x00 || ser256(k_par)
    data.push_back(0x00);
    const auto priv_bytes = parent_priv->ToCanonicalBytes();
    data.insert(data.end(), priv_bytes.begin(), priv_bytes.end());
  } else {
    data.insert(data.end(), parent_pub.begin(), parent_pub.end());
  }
  AppendU32Be(index, &data);

  FixedBytes<64> digest = HmacSha512(chain_code, data);
  SecureZeroize(&data);

  DerivedKey out;
  std::copy(digest.begin() + 32, digest.end(), out.chain_code.begin());

  Scalar tweak;
  try {
    tweak = Scalar::FromCanonicalBytes(std::span<const uint8_t>(digest.data(), 32));
  } catch (const std::invalid_argument&) {
    SecureZeroize(&digest);
    throw InvalidInputError("bip32 tweak is out of range, derive the next index instead");
  }
  SecureZeroize(&digest);
  if (tweak.IsZero()) {
    throw InvalidInputError("bip32 tweak is zero, derive the next index instead");
  }

  if (parent_priv.has_value()) {
    // k_i = IL + k_par (mod n)
    const Scalar child = tweak + *parent_priv;
    if (child.IsZero()) {
      throw InvalidInputError("bip32 child key is zero, derive the next index instead");
    }
    out.privkey = child.ToCanonicalBytes();
    out.pubkey = ECPoint::GeneratorMultiply(child).compressed();
  } else {
    // K_i = IL*G + K_par
    try {
      const ECPoint child = ECPoint::GeneratorMultiply(tweak).Add(ECPoint::FromCompressed(parent_pub));
      out.pubkey = child.compressed();
    } catch (const std::invalid_argument&) {
      throw InvalidInputError("bip32 child key is infinity, derive the next index instead");
    }
  }
  return out;
}

DerivedKey Bip32DerivePath(const ChainCode& chain_code,
                           std::span<const uint8_t> master_key,
                           const DerivationPath& path) {
  DerivedKey current;
  current.chain_code = chain_code;
  if (master_key.size() == kPrivateKeyLen) {
    current.privkey = ParsePrivateKey(master_key).ToCanonicalBytes();
    current.pubkey = PrivToPubkey(*current.privkey);
  } else if (master_key.size() == kPublicKeyLen) {
    if (!IsValidPublicKey(master_key)) {
      throw InvalidInputError("bip32 master public key is not a valid point");
    }
    std::copy(master_key.begin(), master_key.end(), current.pubkey.begin());
  } else {
    throw InvalidInputError("bip32 master key must be 32 (private) or 33 (public) bytes");
  }

  for (uint32_t index : path) {
    DerivedKey next;
    if (current.privkey.has_value()) {
      next = Bip32DeriveChild(current.chain_code, *current.privkey, index);
    } else {
      next = Bip32DeriveChild(current.chain_code, current.pubkey, index);
    }
    SecureZeroize(&current.privkey);
    current = std::move(next);
  }
  return current;
}

}  // namespace cktap
