// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "pow/pow_provider.hpp"

#include "client/error.hpp"
#include "pow/score.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <atomic>
#include <limits>
#include <system_error>
#include <thread>
#include <vector>

namespace tangle {
namespace pow {

PowProvider::PowProvider(bool local, unsigned worker_count)
    : local_(local), worker_count_(worker_count != 0 ? worker_count : std::max(1u, std::thread::hardware_concurrency())) {}

uint64_t PowProvider::Nonce(std::span<const uint8_t> payload, double target_score) const {
  if (!local_) {
    return 0;
  }

  const auto required = RequiredTrailingZeros(payload.size(), target_score);
  if (!required) {
    throw Error(ErrorKind::ProofOfWorkFailed, "unusable target score " + std::to_string(target_score));
  }
  const unsigned target_tz = *required;
  const util::Hash256 digest = PowDigest(payload);

  LOG_POW_DEBUG("searching nonce: {} bytes, target score {}, {} trailing zeros, {} workers", payload.size(),
                target_score, target_tz, worker_count_);

  std::atomic<bool> found{false};
  std::atomic<uint64_t> result{0};

  // Worker i owns [begin_i, end_i]; the last worker's slice ends at the top
  // of the nonce space
  const uint64_t span = std::numeric_limits<uint64_t>::max() / worker_count_;
  auto worker = [&](unsigned i) {
    const uint64_t begin = span * i;
    const uint64_t end = (i + 1 == worker_count_) ? std::numeric_limits<uint64_t>::max() : begin + span - 1;
    for (uint64_t nonce = begin;; ++nonce) {
      if (found.load(std::memory_order_relaxed)) {
        return;
      }
      if (TrailingZeros(digest, nonce) >= target_tz) {
        bool expected = false;
        if (found.compare_exchange_strong(expected, true)) {
          result.store(nonce);
        }
        return;
      }
      if (nonce == end) {
        return;
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(worker_count_);
  try {
    for (unsigned i = 0; i < worker_count_; ++i) {
      threads.emplace_back(worker, i);
    }
  } catch (const std::system_error& e) {
    // Stop the workers already running before reporting
    found.store(true);
    for (auto& t : threads) {
      t.join();
    }
    LOG_POW_ERROR("failed to start proof-of-work worker: {}", e.what());
    throw Error(ErrorKind::ProofOfWorkFailed, std::string("cannot start worker thread: ") + e.what());
  }

  for (auto& t : threads) {
    t.join();
  }

  if (!found.load()) {
    throw Error(ErrorKind::ProofOfWorkFailed, "nonce space exhausted");
  }
  LOG_POW_DEBUG("found nonce {}", result.load());
  return result.load();
}

}  // namespace pow
}  // namespace tangle
