#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "cktap/crypto/types.hpp"
#include "cktap/protocol/types.hpp"

namespace cktap {

struct FactoryRoot {
  PublicKey key{};
  std::string label;

  // Raises InvalidInputError unless hex decodes to a valid compressed point.
  static FactoryRoot FromHex(std::string_view hex, std::string label);
};

struct VerifierConfig {
  std::vector<FactoryRoot> factory_roots;
  size_t addr_trim = kDefaultAddrTrim;
  bool testnet = false;

  // Production factory root plus the testing root, mainnet addresses.
  static VerifierConfig Default();
};

}  // namespace cktap
