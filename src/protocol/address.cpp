#include "cktap/protocol/address.hpp"

#include <algorithm>

#include "cktap/common/errors.hpp"
#include "cktap/common/secure_zeroize.hpp"
#include "cktap/crypto/ecdsa.hpp"
#include "cktap/crypto/encoding.hpp"
#include "cktap/crypto/hash.hpp"
#include "cktap/protocol/bip32.hpp"

namespace cktap {
namespace {

constexpr char kMainnetHrp[] = "bc";
constexpr char kTestnetHrp[] = "tb";

constexpr size_t kIdentSkip = 8;
constexpr size_t kIdentChars = 20;
constexpr size_t kIdentGroup = 5;

}  // namespace

std::string RenderAddress(std::span<const uint8_t> key, bool testnet) {
  PublicKey pubkey{};
  if (key.size() == kPrivateKeyLen) {
    PrivateKey priv = ToFixed<kPrivateKeyLen>(key, "private key");
    pubkey = PrivToPubkey(priv);
    SecureZeroize(&priv);
  } else if (key.size() == kPublicKeyLen) {
    std::copy(key.begin(), key.end(), pubkey.begin());
  } else {
    throw InvalidInputError("address key must be a 33-byte public key or 32-byte private key");
  }

  const Hash160Digest program = Hash160(pubkey);
  return EncodeSegwitAddress(testnet ? kTestnetHrp : kMainnetHrp, 0, program);
}

std::string CardPubkeyToIdent(std::span<const uint8_t> card_pubkey) {
  if (card_pubkey.size() != kPublicKeyLen) {
    throw InvalidInputError("expecting a 33-byte compressed pubkey");
  }

  const Digest32 digest = Sha256(card_pubkey);
  const std::string md = Base32Encode(std::span<const uint8_t>(digest).subspan(kIdentSkip));

  std::string out;
  for (size_t i = 0; i < kIdentChars; i += kIdentGroup) {
    if (!out.empty()) {
      out.push_back('-');
    }
    out += md.substr(i, kIdentGroup);
  }
  return out;
}

DerivedAddress VerifyDeriveAddress(const ChainCode& chain_code,
                                   std::span<const uint8_t> master_key,
                                   bool testnet) {
  // m/0, the first non-hardened child
  const DerivedKey child = Bip32DerivePath(chain_code, master_key, DerivationPath{0});

  DerivedAddress out;
  out.pubkey = child.pubkey;
  out.address = RenderAddress(child.pubkey, testnet);
  return out;
}

}  // namespace cktap
