// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <span>

namespace tangle {
namespace pow {

/**
 * PowProvider - finds a nonce for an outbound message
 *
 * Local mode searches in parallel: worker i scans its own slice
 * [i * span, (i + 1) * span) of the 64-bit nonce space and the first
 * qualifying nonce stops every worker. Remote mode returns 0 and leaves
 * the work to the node.
 *
 * Nonce() throws Error(ProofOfWorkFailed) when the target is unusable,
 * a worker thread cannot be started, or the nonce space is exhausted.
 */
class PowProvider {
public:
  // worker_count 0 = std::thread::hardware_concurrency() (at least 1)
  explicit PowProvider(bool local = true, unsigned worker_count = 0);

  // payload is the message encoding without its nonce
  uint64_t Nonce(std::span<const uint8_t> payload, double target_score) const;

  bool is_local() const { return local_; }
  unsigned worker_count() const { return worker_count_; }

private:
  bool local_;
  unsigned worker_count_;
};

}  // namespace pow
}  // namespace tangle
