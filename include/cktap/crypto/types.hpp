#pragma once

#include <cstddef>

#include "cktap/common/bytes.hpp"

namespace cktap {

constexpr size_t kPublicKeyLen = 33;
constexpr size_t kPrivateKeyLen = 32;
constexpr size_t kDigestLen = 32;
constexpr size_t kCompactSignatureLen = 64;
constexpr size_t kRecoverableSignatureLen = 65;
constexpr size_t kHash160Len = 20;

using PublicKey = FixedBytes<kPublicKeyLen>;
using PrivateKey = FixedBytes<kPrivateKeyLen>;
using Digest32 = FixedBytes<kDigestLen>;
using Hash160Digest = FixedBytes<kHash160Len>;
using CompactSignature = FixedBytes<kCompactSignatureLen>;
// header byte || r || s
using RecoverableSignature = FixedBytes<kRecoverableSignatureLen>;

}  // namespace cktap
