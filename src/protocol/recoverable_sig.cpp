#include "cktap/protocol/recoverable_sig.hpp"

#include <algorithm>
#include <string>

#include <spdlog/spdlog.h>

#include "cktap/common/errors.hpp"
#include "cktap/crypto/ecdsa.hpp"
#include "cktap/protocol/address.hpp"

namespace cktap {

RecoverableSignature MakeRecoverableSig(const Digest32& digest,
                                        const CompactSignature& sig,
                                        std::optional<std::string_view> expected_addr,
                                        const std::optional<PublicKey>& expected_pubkey,
                                        bool testnet) {
  if (expected_addr.has_value() && expected_addr->empty()) {
    expected_addr.reset();
  }

  for (int rec_id = 0; rec_id < kMaxRecoveryId; ++rec_id) {
    RecoverableSignature rec_sig{};
    rec_sig[0] = static_cast<uint8_t>(kSegwitRecoveryHeader + rec_id);
    std::copy(sig.begin(), sig.end(), rec_sig.begin() + 1);

    const auto pubkey = TryRecoverPubkey(digest, rec_sig);
    if (!pubkey.has_value()) {
      // ids 2 and 3 need r + n < p, so they are usually unrecoverable
      if (rec_id >= 2) {
        continue;
      }
      throw SignatureRecoveryError("signature does not recover with recovery id " +
                                   std::to_string(rec_id));
    }

    if (expected_pubkey.has_value() && *expected_pubkey != *pubkey) {
      continue;
    }
    if (expected_addr.has_value() && !RenderAddress(*pubkey, testnet).ends_with(*expected_addr)) {
      continue;
    }

    SPDLOG_DEBUG("recoverable signature uses recovery id {}", rec_id);
    return rec_sig;
  }

  throw SignatureRecoveryError("signature was not made by that address/pubkey");
}

}  // namespace cktap
