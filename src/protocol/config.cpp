#include "cktap/protocol/config.hpp"

#include <algorithm>
#include <utility>

#include "cktap/common/errors.hpp"
#include "cktap/crypto/ecdsa.hpp"
#include "cktap/crypto/encoding.hpp"

namespace cktap {
namespace {

constexpr char kFactoryRootHex[] =
    "03028a0e89e70d0ec0d932053a89ab1da7d9182bdc6d2f03e706ee99517d05d9e1";
constexpr char kTestingRootHex[] =
    "027722ef208e681bac05f1b4b3cc478d6bf353ac9a09ff0c843430138f65c27bab";

}  // namespace

FactoryRoot FactoryRoot::FromHex(std::string_view hex, std::string label) {
  const Bytes decoded = HexDecode(hex);
  if (decoded.size() != kPublicKeyLen || !IsValidPublicKey(decoded)) {
    throw InvalidInputError("factory root must be a 33-byte compressed secp256k1 point");
  }

  FactoryRoot out;
  std::copy(decoded.begin(), decoded.end(), out.key.begin());
  out.label = std::move(label);
  return out;
}

VerifierConfig VerifierConfig::Default() {
  VerifierConfig out;
  out.factory_roots.push_back(FactoryRoot::FromHex(kFactoryRootHex, "Root Factory Certificate"));
  out.factory_roots.push_back(
      FactoryRoot::FromHex(kTestingRootHex, "Root Factory Certificate (TESTING ONLY)"));
  return out;
}

}  // namespace cktap
