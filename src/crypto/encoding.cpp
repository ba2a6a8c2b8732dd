#include "cktap/crypto/encoding.hpp"

#include <array>
#include <vector>

#include "cktap/common/errors.hpp"

namespace cktap {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";
constexpr char kBase32Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
constexpr char kBech32Charset[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

uint32_t Bech32Polymod(const std::vector<uint8_t>& values) {
  constexpr std::array<uint32_t, 5> kGenerator = {
      0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3};

  uint32_t chk = 1;
  for (uint8_t value : values) {
    const uint8_t top = static_cast<uint8_t>(chk >> 25);
    chk = ((chk & 0x1ffffff) << 5) ^ value;
    for (size_t i = 0; i < kGenerator.size(); ++i) {
      if ((top >> i) & 1) {
        chk ^= kGenerator[i];
      }
    }
  }
  return chk;
}

std::vector<uint8_t> ExpandHrp(std::string_view hrp) {
  std::vector<uint8_t> out;
  out.reserve(hrp.size() * 2 + 1);
  for (char c : hrp) {
    out.push_back(static_cast<uint8_t>(c) >> 5);
  }
  out.push_back(0);
  for (char c : hrp) {
    out.push_back(static_cast<uint8_t>(c) & 0x1f);
  }
  return out;
}

// Regroup 8-bit bytes into 5-bit words, zero padding the tail.
std::vector<uint8_t> ToFiveBitWords(std::span<const uint8_t> data) {
  std::vector<uint8_t> out;
  out.reserve((data.size() * 8 + 4) / 5);

  uint32_t acc = 0;
  int bits = 0;
  for (uint8_t byte : data) {
    acc = (acc << 8) | byte;
    bits += 8;
    while (bits >= 5) {
      bits -= 5;
      out.push_back(static_cast<uint8_t>((acc >> bits) & 0x1f));
    }
  }
  if (bits > 0) {
    out.push_back(static_cast<uint8_t>((acc << (5 - bits)) & 0x1f));
  }
  return out;
}

}  // namespace

std::string HexEncode(std::span<const uint8_t> data) {
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t byte : data) {
    out.push_back(kHexDigits[byte >> 4]);
    out.push_back(kHexDigits[byte & 0x0f]);
  }
  return out;
}

Bytes HexDecode(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    throw InvalidInputError("hex string has odd length");
  }

  Bytes out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexValue(hex[i]);
    const int lo = HexValue(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw InvalidInputError("hex string has a non-hex character");
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string Base32Encode(std::span<const uint8_t> data) {
  std::string out;
  if (data.empty()) {
    return out;
  }
  out.reserve(((data.size() + 4) / 5) * 8);

  uint32_t buffer = 0;
  int bits_left = 0;
  for (uint8_t byte : data) {
    buffer = (buffer << 8) | byte;
    bits_left += 8;
    while (bits_left >= 5) {
      bits_left -= 5;
      out.push_back(kBase32Alphabet[(buffer >> bits_left) & 0x1f]);
    }
  }
  if (bits_left > 0) {
    out.push_back(kBase32Alphabet[(buffer << (5 - bits_left)) & 0x1f]);
  }

  while (out.size() % 8 != 0) {
    out.push_back('=');
  }
  return out;
}

std::string EncodeSegwitAddress(std::string_view hrp,
                                uint8_t witness_version,
                                std::span<const uint8_t> program) {
  if (hrp.empty()) {
    throw InvalidInputError("bech32 hrp must not be empty");
  }
  if (witness_version != 0) {
    throw InvalidInputError("only witness version 0 addresses are supported");
  }
  if (program.size() != 20 && program.size() != 32) {
    throw InvalidInputError("witness v0 program must be 20 or 32 bytes");
  }

  std::vector<uint8_t> words;
  words.push_back(witness_version);
  const std::vector<uint8_t> program_words = ToFiveBitWords(program);
  words.insert(words.end(), program_words.begin(), program_words.end());

  std::vector<uint8_t> checksum_input = ExpandHrp(hrp);
  checksum_input.insert(checksum_input.end(), words.begin(), words.end());
  checksum_input.insert(checksum_input.end(), 6, 0);
  const uint32_t polymod = Bech32Polymod(checksum_input) ^ 1;

  std::string out(hrp);
  out.push_back('1');
  for (uint8_t word : words) {
    out.push_back(kBech32Charset[word]);
  }
  for (int i = 0; i < 6; ++i) {
    out.push_back(kBech32Charset[(polymod >> (5 * (5 - i))) & 0x1f]);
  }
  return out;
}

}  // namespace cktap
