#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "cktap/crypto/hash.hpp"
#include "cktap/protocol/card_verifier.hpp"
#include "cktap/protocol/nonce.hpp"
#include "cktap/protocol/session_key.hpp"
#include "fake_card.hpp"

namespace {

using cktap::CardVerifier;
using cktap::HostNonce;
using cktap::testing::FakeCard;

struct BenchArgs {
  uint32_t iters = 200;
};

struct OpMetric {
  double total_ms = 0.0;
  uint64_t samples = 0;
};

struct VerifyMetrics {
  OpMetric pick_nonce;
  OpMetric calc_xcvc;
  OpMetric verify_certs;
  OpMetric recover_pubkey;
  OpMetric recover_address;
  OpMetric derive_address;
  OpMetric recoverable_sig;
};

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

uint32_t ParsePositiveU32(const char* value, const char* flag) {
  try {
    const unsigned long parsed = std::stoul(value);
    if (parsed == 0 || parsed > UINT32_MAX) {
      throw std::out_of_range("out of range");
    }
    return static_cast<uint32_t>(parsed);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("invalid value for ") + flag + ": " + value);
  }
}

BenchArgs ParseArgs(int argc, char** argv) {
  BenchArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag == "--iters" && i + 1 < argc) {
      args.iters = ParsePositiveU32(argv[++i], "--iters");
    } else if (flag == "--help") {
      std::cout << "Usage: verify_bench [--iters N]\n";
      std::exit(0);
    } else {
      throw std::invalid_argument("unknown argument: " + flag);
    }
  }
  return args;
}

template <typename Fn>
void Measure(OpMetric* metric, Fn&& fn) {
  const auto start = std::chrono::steady_clock::now();
  fn();
  const auto end = std::chrono::steady_clock::now();
  metric->total_ms += std::chrono::duration<double, std::milli>(end - start).count();
  metric->samples += 1;
}

void RunRound(const FakeCard& tapsigner,
              const FakeCard& satscard,
              const CardVerifier& verifier,
              VerifyMetrics* metrics) {
  HostNonce host_nonce{};
  Measure(&metrics->pick_nonce, [&]() { host_nonce = cktap::PickNonce(); });

  const cktap::StatusResponse tap_status = tapsigner.Status();
  cktap::XcvcResult xcvc;
  Measure(&metrics->calc_xcvc, [&]() {
    xcvc = cktap::CalcXcvc("read", tap_status.card_nonce, tap_status.pubkey, std::vector<uint8_t>(6, '1'));
  });

  const cktap::CheckResponse check = tapsigner.Check(host_nonce);
  const cktap::CertsResponse certs = tapsigner.Certs();
  Measure(&metrics->verify_certs, [&]() {
    const cktap::FactoryRoot root = verifier.VerifyCerts(tap_status, check, certs, host_nonce);
    Expect(root.key == tapsigner.root().pub, "chain did not reach the root");
  });

  const cktap::ReadResponse tap_read = tapsigner.TapsignerRead(host_nonce, xcvc.auth.epubkey);
  Measure(&metrics->recover_pubkey, [&]() {
    Expect(verifier.RecoverPubkey(tap_status, tap_read, host_nonce, xcvc.session_key) == tapsigner.slot().pub,
           "recovered wrong pubkey");
  });

  const cktap::StatusResponse sats_status = satscard.Status();
  const cktap::ReadResponse sats_read = satscard.SatscardRead(host_nonce);
  Measure(&metrics->recover_address, [&]() {
    (void)verifier.RecoverAddress(sats_status, sats_read, host_nonce);
  });

  Measure(&metrics->derive_address, [&]() {
    (void)verifier.VerifyDeriveAddress(satscard.chain_code(), satscard.slot().pub);
  });

  const cktap::Digest32 digest = cktap::Sha256(host_nonce);
  const cktap::CompactSignature sig = cktap::SignCompact(digest, satscard.slot().priv);
  const std::string addr = verifier.RenderAddress(satscard.slot().pub);
  Measure(&metrics->recoverable_sig, [&]() {
    (void)verifier.MakeRecoverableSig(digest, sig, addr);
  });
}

void PrintMetricLine(const std::string& name, const OpMetric& metric) {
  const double avg_ms = metric.total_ms / static_cast<double>(metric.samples);
  std::cout << std::left << std::setw(18) << name << "  "
            << std::right << std::setw(12) << std::fixed << std::setprecision(3) << avg_ms << '\n';
}

void PrintSummary(const VerifyMetrics& metrics) {
  std::cout << "\n[Verify]\n";
  std::cout << std::left << std::setw(18) << "Operation"
            << "  " << std::right << std::setw(12) << "Avg ms\n";
  PrintMetricLine("pick_nonce", metrics.pick_nonce);
  PrintMetricLine("calc_xcvc", metrics.calc_xcvc);
  PrintMetricLine("verify_certs", metrics.verify_certs);
  PrintMetricLine("recover_pubkey", metrics.recover_pubkey);
  PrintMetricLine("recover_address", metrics.recover_address);
  PrintMetricLine("derive_address", metrics.derive_address);
  PrintMetricLine("recoverable_sig", metrics.recoverable_sig);
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const BenchArgs args = ParseArgs(argc, argv);
    // every successful chain check logs at info
    spdlog::set_level(spdlog::level::warn);
    std::cout << "Verify benchmark config: iters=" << args.iters << '\n';

    const FakeCard tapsigner(/*is_tapsigner=*/true);
    const FakeCard satscard(/*is_tapsigner=*/false);
    const CardVerifier verifier(tapsigner.Config());

    VerifyMetrics metrics;
    for (uint32_t i = 0; i < args.iters; ++i) {
      RunRound(tapsigner, satscard, verifier, &metrics);
    }

    PrintSummary(metrics);
  } catch (const std::exception& ex) {
    std::cerr << "benchmark failed: " << ex.what() << '\n';
    return 1;
  }
  return 0;
}
