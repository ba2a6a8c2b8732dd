#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "cktap/common/bytes.hpp"
#include "cktap/common/errors.hpp"
#include "cktap/crypto/types.hpp"

namespace cktap {

constexpr size_t kCardNonceLen = 16;
constexpr size_t kHostNonceLen = 16;
constexpr size_t kChainCodeLen = 32;
constexpr size_t kSessionKeyLen = 32;

constexpr size_t kMinCvcLen = 6;
constexpr size_t kMaxCvcLen = 32;

// Characters of the payment address a SATSCARD reveals on each side of the
// redacted middle.
constexpr size_t kDefaultAddrTrim = 12;

// Cards at this firmware version never attest to the sealed slot pubkey.
constexpr std::string_view kLegacyCertsVersion = "0.9.0";

using CardNonce = FixedBytes<kCardNonceLen>;
using HostNonce = FixedBytes<kHostNonceLen>;
using ChainCode = FixedBytes<kChainCodeLen>;
using SessionKey = FixedBytes<kSessionKeyLen>;

// Converts a transport-decoded field to its fixed protocol width.
template <size_t N>
FixedBytes<N> ToFixed(std::span<const uint8_t> bytes, std::string_view field_name) {
  if (bytes.size() != N) {
    throw FramingError(std::string(field_name) + " must be " + std::to_string(N) + " bytes, got " +
                       std::to_string(bytes.size()));
  }
  FixedBytes<N> out{};
  std::copy(bytes.begin(), bytes.end(), out.begin());
  return out;
}

struct SlotInfo {
  uint8_t active = 0;
  uint8_t total = 0;
};

// Fields of the card replies, already decoded by the transport.
struct StatusResponse {
  std::string version;
  CardNonce card_nonce{};
  PublicKey pubkey{};
  bool is_tapsigner = false;
  std::optional<SlotInfo> slots;
  // SATSCARD only: address with the middle replaced by "_..._" style redaction
  std::string addr;
};

struct ReadResponse {
  PublicKey pubkey{};
  CompactSignature sig{};
};

struct CheckResponse {
  CompactSignature auth_sig{};
};

struct CertsResponse {
  std::vector<RecoverableSignature> cert_chain;
};

}  // namespace cktap
