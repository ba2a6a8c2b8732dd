#include "cktap/protocol/nonce.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "cktap/common/errors.hpp"
#include "cktap/crypto/random.hpp"

namespace cktap {

bool IsDegenerateNonce(std::span<const uint8_t> nonce) {
  if (nonce.empty()) {
    return true;
  }
  return std::all_of(nonce.begin(), nonce.end(), [&](uint8_t b) { return b == nonce.front(); });
}

HostNonce PickNonce() {
  return PickNonce([](std::span<uint8_t> out) { Csprng::Fill(out); });
}

HostNonce PickNonce(const RandomFill& fill) {
  if (!fill) {
    throw InvalidInputError("nonce random source must be set");
  }

  for (size_t attempt = 0; attempt < kNonceAttempts; ++attempt) {
    HostNonce nonce{};
    fill(nonce);
    if (!IsDegenerateNonce(nonce)) {
      return nonce;
    }
    SPDLOG_WARN("degenerate host nonce on attempt {}, retrying", attempt + 1);
  }

  SPDLOG_ERROR("random source produced {} degenerate nonces in a row", kNonceAttempts);
  throw EntropyError("random source is producing degenerate nonces");
}

}  // namespace cktap
