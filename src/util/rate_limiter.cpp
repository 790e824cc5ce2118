// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace tangle {
namespace util {

bool RateLimiter::should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds) {
  if (tokens_per_period <= 0 || period_seconds <= 0) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  const auto now = GetSteadyTime();
  const double capacity = static_cast<double>(tokens_per_period);

  auto it = buckets_.find(callsite_key);
  if (it == buckets_.end()) {
    if (buckets_.size() >= MAX_TRACKED_CALLSITES) {
      buckets_.clear();
    }
    // New callsites start with a full bucket (burst)
    it = buckets_.emplace(callsite_key, TokenBucket{capacity, now}).first;
  }

  TokenBucket& bucket = it->second;
  const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - bucket.last_refill).count();
  if (elapsed > 0) {
    const double refill_rate = capacity / period_seconds;
    bucket.tokens = std::min(bucket.tokens + refill_rate * static_cast<double>(elapsed), capacity);
    bucket.last_refill = now;
  }

  if (bucket.tokens < 1.0) {
    return false;
  }
  bucket.tokens -= 1.0;
  return true;
}

size_t RateLimiter::tracked_callsites() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buckets_.size();
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter instance;
  return instance;
}

}  // namespace util
}  // namespace tangle
