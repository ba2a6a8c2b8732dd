#include "cktap/protocol/response_recovery.hpp"

#include <algorithm>
#include <string_view>

#include <spdlog/spdlog.h>

#include "cktap/common/errors.hpp"
#include "cktap/crypto/ecdsa.hpp"
#include "cktap/crypto/encoding.hpp"
#include "cktap/crypto/hash.hpp"
#include "cktap/protocol/address.hpp"
#include "cktap/protocol/framing.hpp"
#include "cktap/protocol/session_key.hpp"

namespace cktap {
namespace {

constexpr char kAddrSeparator = '_';

// TAPSIGNER has a single slot; its read message carries a zero context byte.
constexpr uint8_t kTapsignerReadContext = 0x00;

}  // namespace

PublicKey RecoverPubkeyFromRead(const StatusResponse& status,
                                const ReadResponse& read,
                                const HostNonce& host_nonce,
                                const SessionKey& session_key) {
  if (!status.is_tapsigner) {
    throw WrongDeviceTypeError("pubkey recovery needs a TAPSIGNER");
  }

  const Bytes msg = FrameMessage(status.card_nonce, host_nonce, kTapsignerReadContext);

  PublicKey pubkey = read.pubkey;
  const Bytes unmasked = XorBytes(std::span<const uint8_t>(read.pubkey).subspan(1), session_key);
  std::copy(unmasked.begin(), unmasked.end(), pubkey.begin() + 1);

  // proves the card holds the key it just revealed
  if (!VerifySignature(read.sig, Sha256(msg), pubkey)) {
    SPDLOG_WARN("TAPSIGNER {} failed proof of possession on read", HexEncode(status.pubkey));
    throw ProofOfPossessionError("bad signature in pubkey recovery");
  }
  return pubkey;
}

RecoveredAddress RecoverAddressFromRead(const StatusResponse& status,
                                        const ReadResponse& read,
                                        const HostNonce& host_nonce,
                                        size_t addr_trim,
                                        bool testnet) {
  if (status.is_tapsigner) {
    throw WrongDeviceTypeError("address recovery is not supported on a TAPSIGNER");
  }
  if (!status.slots.has_value()) {
    throw FramingError("status response has no slot information");
  }

  const Bytes msg = FrameMessage(status.card_nonce, host_nonce, status.slots->active);

  if (!VerifySignature(read.sig, Sha256(msg), read.pubkey)) {
    SPDLOG_WARN("SATSCARD {} failed proof of possession on slot {}", HexEncode(status.pubkey),
                status.slots->active);
    throw ProofOfPossessionError("bad signature in address recovery");
  }

  const std::string_view expect = status.addr;
  const size_t first_sep = expect.find(kAddrSeparator);
  const size_t last_sep = expect.rfind(kAddrSeparator);
  if (first_sep == std::string_view::npos) {
    SPDLOG_WARN("status address \"{}\" has no redaction window", status.addr);
    throw CounterfeitDeviceError("status address is not in redacted form");
  }
  const std::string_view left = expect.substr(0, first_sep);
  const std::string_view right = expect.substr(last_sep + 1);

  // counterfeit check: the independently rendered address must agree
  const std::string addr = RenderAddress(read.pubkey, testnet);
  const bool matches = addr.starts_with(left) && addr.ends_with(right) &&
                       left.size() == addr_trim && right.size() == addr_trim;
  if (!matches) {
    SPDLOG_WARN("rendered address {} does not match card-reported {}", addr, status.addr);
    throw CounterfeitDeviceError("card address does not match its key, corrupt response");
  }

  RecoveredAddress out;
  out.pubkey = read.pubkey;
  out.address = addr;
  return out;
}

PublicKey VerifyMasterPubkey(const PublicKey& pubkey,
                             const CompactSignature& sig,
                             const ChainCode& chain_code,
                             const HostNonce& host_nonce,
                             const CardNonce& card_nonce) {
  const Bytes msg = FrameMessage(card_nonce, host_nonce, chain_code);

  if (!VerifySignature(sig, Sha256(msg), pubkey)) {
    SPDLOG_WARN("card failed to sign derive response with master pubkey {}", HexEncode(pubkey));
    throw ProofOfPossessionError("bad signature in master pubkey verification");
  }
  return pubkey;
}

}  // namespace cktap
