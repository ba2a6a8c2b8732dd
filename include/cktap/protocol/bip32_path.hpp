#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cktap {

constexpr uint32_t kHardenedBit = 0x80000000;

using DerivationPath = std::vector<uint32_t>;

// Parses "m/84h/0'/0p/5". Accepts ' p h H P as hardening markers, skips the
// "m" root and empty components. Raises MalformedPathError for a marker with
// no digits or non-numeric text, PathRangeError for values outside [0, 2^31).
DerivationPath StrToPath(std::string_view path);

// Canonical form: "m" root, 'h' marker on hardened components.
std::string PathToStr(const DerivationPath& path);

bool AllHardened(const DerivationPath& path);
bool NoneHardened(const DerivationPath& path);

}  // namespace cktap
