#include "cktap/protocol/bip32_path.hpp"

#include <algorithm>

#include "cktap/common/errors.hpp"

namespace cktap {
namespace {

constexpr std::string_view kHardenedMarkers = "'phHP";

uint32_t ParseIndex(std::string_view digits, std::string_view component) {
  if (!digits.empty() && digits.front() == '-') {
    const bool numeric = digits.size() > 1 &&
                         std::all_of(digits.begin() + 1, digits.end(), [](char c) { return c >= '0' && c <= '9'; });
    if (numeric) {
      throw PathRangeError("path component out of range: " + std::string(component));
    }
    throw MalformedPathError("malformed bip32 path component: " + std::string(component));
  }
  if (digits.empty()) {
    throw MalformedPathError("malformed bip32 path component: " + std::string(component));
  }

  uint64_t value = 0;
  for (char c : digits) {
    if (c < '0' || c > '9') {
      throw MalformedPathError("malformed bip32 path component: " + std::string(component));
    }
    value = value * 10 + static_cast<uint64_t>(c - '0');
    if (value >= kHardenedBit) {
      throw PathRangeError("path component out of range: " + std::string(component));
    }
  }
  return static_cast<uint32_t>(value);
}

}  // namespace

DerivationPath StrToPath(std::string_view path) {
  DerivationPath out;

  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string_view::npos) {
      end = path.size();
    }
    const std::string_view item = path.substr(start, end - start);
    start = end + 1;

    // root marker, trailing or duplicated slashes
    if (item.empty() || item == "m") {
      continue;
    }

    if (kHardenedMarkers.find(item.back()) != std::string_view::npos) {
      if (item.size() < 2) {
        throw MalformedPathError("malformed bip32 path component: " + std::string(item));
      }
      out.push_back(ParseIndex(item.substr(0, item.size() - 1), item) | kHardenedBit);
    } else {
      out.push_back(ParseIndex(item, item));
    }
  }
  return out;
}

std::string PathToStr(const DerivationPath& path) {
  std::string out = "m";
  for (uint32_t item : path) {
    out.push_back('/');
    out += std::to_string(item & ~kHardenedBit);
    if (item & kHardenedBit) {
      out.push_back('h');
    }
  }
  return out;
}

bool AllHardened(const DerivationPath& path) {
  return std::all_of(path.begin(), path.end(), [](uint32_t item) { return (item & kHardenedBit) != 0; });
}

bool NoneHardened(const DerivationPath& path) {
  return std::none_of(path.begin(), path.end(), [](uint32_t item) { return (item & kHardenedBit) != 0; });
}

}  // namespace cktap
