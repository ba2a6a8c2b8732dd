#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cktap/common/errors.hpp"
#include "cktap/crypto/ecdsa.hpp"
#include "cktap/crypto/encoding.hpp"
#include "cktap/protocol/address.hpp"
#include "cktap/protocol/bip32.hpp"
#include "cktap/protocol/bip32_path.hpp"

namespace {

using cktap::AllHardened;
using cktap::ChainCode;
using cktap::DerivationPath;
using cktap::kHardenedBit;
using cktap::NoneHardened;
using cktap::PathToStr;
using cktap::PrivateKey;
using cktap::PublicKey;
using cktap::StrToPath;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

template <typename E>
void ExpectThrowAs(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const E&) {
    return;
  } catch (const std::exception& ex) {
    throw std::runtime_error("Wrong exception (" + std::string(ex.what()) + "): " + message);
  }
  throw std::runtime_error("Expected exception: " + message);
}

void TestParseAndFormat() {
  const DerivationPath bip84 = StrToPath("m/84h/0'/0p/1/5");
  const DerivationPath expected = {84 | kHardenedBit, 0 | kHardenedBit, 0 | kHardenedBit, 1, 5};
  Expect(bip84 == expected, "all hardening markers are accepted");
  Expect(PathToStr(bip84) == "m/84h/0h/0h/1/5", "canonical form uses 'h'");

  Expect(StrToPath("m").empty(), "bare root parses to empty path");
  Expect(StrToPath("").empty(), "empty text parses to empty path");
  Expect(PathToStr({}) == "m", "empty path formats as root");
  Expect(StrToPath("m//0/") == DerivationPath{0}, "duplicate and trailing slashes are skipped");
  Expect(StrToPath("44H/1P") == DerivationPath{44 | kHardenedBit, 1 | kHardenedBit},
         "upper case markers and a missing root are accepted");
  Expect(StrToPath("m/2147483647h") == DerivationPath{0xFFFFFFFF}, "largest hardened index");
}

void TestRoundTrip() {
  const std::vector<DerivationPath> paths = {
      {},
      {0},
      {0 | kHardenedBit},
      {84 | kHardenedBit, 0 | kHardenedBit, 0 | kHardenedBit, 0, 7},
      {0x7FFFFFFF, 0xFFFFFFFF},
  };
  for (const auto& path : paths) {
    Expect(StrToPath(PathToStr(path)) == path, "str/path round-trip for " + PathToStr(path));
  }
}

void TestRejects() {
  ExpectThrowAs<cktap::PathRangeError>([]() { (void)StrToPath("m/2147483648"); },
                                       "non-hardened component >= 2^31");
  ExpectThrowAs<cktap::PathRangeError>([]() { (void)StrToPath("m/2147483648h"); },
                                       "hardened component >= 2^31 before flagging");
  ExpectThrowAs<cktap::PathRangeError>([]() { (void)StrToPath("m/99999999999999999999"); },
                                       "huge component does not overflow");
  ExpectThrowAs<cktap::PathRangeError>([]() { (void)StrToPath("m/-1"); }, "negative component");
  ExpectThrowAs<cktap::MalformedPathError>([]() { (void)StrToPath("m/h"); }, "marker with no digits");
  ExpectThrowAs<cktap::MalformedPathError>([]() { (void)StrToPath("m/0/'"); }, "lone apostrophe");
  ExpectThrowAs<cktap::MalformedPathError>([]() { (void)StrToPath("m/abc"); }, "non-numeric component");
  ExpectThrowAs<cktap::MalformedPathError>([]() { (void)StrToPath("m/1x"); }, "trailing garbage");
}

void TestHardenedPredicates() {
  Expect(AllHardened(StrToPath("m/84h/0h")), "all hardened");
  Expect(!AllHardened(StrToPath("m/84h/0")), "mixed path is not all hardened");
  Expect(NoneHardened(StrToPath("m/0/1")), "none hardened");
  Expect(!NoneHardened(StrToPath("m/0/1h")), "mixed path is not none hardened");
  Expect(AllHardened({}) && NoneHardened({}), "empty path satisfies both predicates");
}

void TestPublicMatchesPrivateDerivation() {
  ChainCode chain_code{};
  chain_code.fill(0x5a);
  PrivateKey master{};
  master.fill(0x42);
  const PublicKey master_pub = cktap::PrivToPubkey(master);

  const auto from_priv = cktap::Bip32DeriveChild(chain_code, master, 0);
  const auto from_pub = cktap::Bip32DeriveChild(chain_code, master_pub, 0);
  Expect(from_priv.privkey.has_value(), "private parent yields private child");
  Expect(!from_pub.privkey.has_value(), "public parent yields public-only child");
  Expect(from_priv.pubkey == from_pub.pubkey, "CKDpriv and CKDpub agree on m/0");
  Expect(from_priv.chain_code == from_pub.chain_code, "CKDpriv and CKDpub agree on chain code");
  Expect(cktap::PrivToPubkey(*from_priv.privkey) == from_priv.pubkey, "child keypair is consistent");
  Expect(from_priv.pubkey != master_pub, "child differs from parent");

  const auto deep_priv = cktap::Bip32DerivePath(chain_code, master, StrToPath("m/0/1/2"));
  const auto deep_pub = cktap::Bip32DerivePath(chain_code, master_pub, StrToPath("m/0/1/2"));
  Expect(deep_priv.pubkey == deep_pub.pubkey, "multi-step public and private derivation agree");

  const auto hardened = cktap::Bip32DerivePath(chain_code, master, StrToPath("m/0h"));
  Expect(hardened.pubkey != from_priv.pubkey, "hardened child differs from normal child");
  ExpectThrowAs<cktap::InvalidInputError>(
      [&]() { (void)cktap::Bip32DeriveChild(chain_code, master_pub, 0 | kHardenedBit); },
      "hardened derivation needs a private key");
  ExpectThrowAs<cktap::InvalidInputError>(
      [&]() { (void)cktap::Bip32DeriveChild(chain_code, std::vector<uint8_t>(20, 0x01), 0); },
      "parent key length is checked");
}

void TestRenderAddressAndDerive() {
  PrivateKey one{};
  one[31] = 1;
  const PublicKey generator = cktap::PrivToPubkey(one);

  Expect(cktap::RenderAddress(generator) == "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4",
         "mainnet address of the generator");
  Expect(cktap::RenderAddress(generator, true) == "tb1qw508d6qejxtdg4y5r3zarvary0c5xw7kxpjzsx",
         "testnet address of the generator");
  Expect(cktap::RenderAddress(one) == cktap::RenderAddress(generator),
         "private key renders like its public key");
  Expect(cktap::RenderAddress(generator) == cktap::RenderAddress(generator), "rendering is deterministic");
  ExpectThrowAs<cktap::InvalidInputError>(
      [&]() { (void)cktap::RenderAddress(std::vector<uint8_t>(20, 0x01)); }, "key length is checked");

  ChainCode chain_code{};
  chain_code.fill(0x07);
  PrivateKey master{};
  master.fill(0x42);
  const auto before_unseal = cktap::VerifyDeriveAddress(chain_code, cktap::PrivToPubkey(master));
  const auto after_unseal = cktap::VerifyDeriveAddress(chain_code, master);
  Expect(before_unseal.address == after_unseal.address, "m/0 address is the same before and after unseal");
  Expect(before_unseal.pubkey == after_unseal.pubkey, "m/0 pubkey is the same before and after unseal");
  Expect(before_unseal.address == cktap::RenderAddress(before_unseal.pubkey), "address matches pubkey");
  Expect(cktap::VerifyDeriveAddress(chain_code, master, true).address.starts_with("tb1q"),
         "testnet derivation renders a tb1 address");
}

void TestIdent() {
  PrivateKey priv{};
  priv.fill(0x33);
  const std::string ident = cktap::CardPubkeyToIdent(cktap::PrivToPubkey(priv));
  Expect(ident.size() == 23, "ident is 23 characters");
  for (size_t i = 0; i < ident.size(); ++i) {
    if (i % 6 == 5) {
      Expect(ident[i] == '-', "ident groups are dash separated");
    } else {
      Expect((ident[i] >= 'A' && ident[i] <= 'Z') || (ident[i] >= '2' && ident[i] <= '7'),
             "ident uses the base32 alphabet");
    }
  }
  Expect(ident == cktap::CardPubkeyToIdent(cktap::PrivToPubkey(priv)), "ident is deterministic");
  ExpectThrowAs<cktap::InvalidInputError>(
      [&]() { (void)cktap::CardPubkeyToIdent(std::vector<uint8_t>(32, 0x02)); }, "ident needs 33 bytes");
}

}  // namespace

int main() {
  try {
    TestParseAndFormat();
    TestRoundTrip();
    TestRejects();
    TestHardenedPredicates();
    TestPublicMatchesPrivateDerivation();
    TestRenderAddressAndDerive();
    TestIdent();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Path codec and derivation tests passed" << '\n';
  return 0;
}
