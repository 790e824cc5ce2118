// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Rate limiter for logging

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tangle {
namespace util {

/**
 * RateLimiter - Token bucket rate limiter for logging
 *
 * Each callsite gets a bucket of N tokens that refills continuously over
 * the period.
 */
class RateLimiter {
public:
  // Returns true if the message for callsite_key should be logged. tokens_per_period
  // is the burst size, period_seconds the time for a full refill.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  // Number of callsites currently tracked
  size_t tracked_callsites() const;

  static RateLimiter& instance();

private:
  struct TokenBucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last_refill{};
  };

  // All buckets are dropped once this many callsites exist
  static constexpr size_t MAX_TRACKED_CALLSITES = 4096;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace util
}  // namespace tangle
