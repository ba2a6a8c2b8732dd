#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>

#include "cktap/protocol/types.hpp"

namespace cktap {

constexpr size_t kNonceAttempts = 3;

using RandomFill = std::function<void(std::span<uint8_t> out)>;

// True when every byte has the same value.
bool IsDegenerateNonce(std::span<const uint8_t> nonce);

// Fresh host nonce from the CSPRNG. Raises EntropyError if kNonceAttempts
// draws in a row are degenerate.
HostNonce PickNonce();
HostNonce PickNonce(const RandomFill& fill);

}  // namespace cktap
