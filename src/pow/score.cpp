// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "pow/score.hpp"

#include <bit>
#include <cmath>
#include <stdexcept>

#include <blake2.h>

namespace tangle {
namespace pow {

namespace {

constexpr unsigned MAX_TRAILING_ZEROS = 256;

double ScoreFor(unsigned tz, size_t payload_size) {
  return std::ldexp(1.0, static_cast<int>(tz)) / static_cast<double>(payload_size + 8);
}

}  // namespace

util::Hash256 PowDigest(std::span<const uint8_t> payload) {
  return util::Blake2b256(payload);
}

unsigned TrailingZeros(const util::Hash256& pow_digest, uint64_t nonce) {
  uint8_t le_nonce[8];
  for (int i = 0; i < 8; ++i) {
    le_nonce[i] = static_cast<uint8_t>(nonce >> (8 * i));
  }

  util::Hash256 h{};
  blake2b_state state;
  if (blake2b_init(&state, h.size()) != 0 || blake2b_update(&state, pow_digest.data(), pow_digest.size()) != 0 ||
      blake2b_update(&state, le_nonce, sizeof(le_nonce)) != 0 || blake2b_final(&state, h.data(), h.size()) != 0) {
    throw std::runtime_error("blake2b failed");
  }

  unsigned tz = 0;
  for (auto it = h.rbegin(); it != h.rend(); ++it) {
    if (*it != 0) {
      return tz + static_cast<unsigned>(std::countr_zero(*it));
    }
    tz += 8;
  }
  return tz;
}

double Score(std::span<const uint8_t> payload, uint64_t nonce) {
  return ScoreFor(TrailingZeros(PowDigest(payload), nonce), payload.size());
}

std::optional<unsigned> RequiredTrailingZeros(size_t payload_size, double target_score) {
  if (!std::isfinite(target_score) || target_score <= 0.0) {
    return std::nullopt;
  }
  const double needed = target_score * static_cast<double>(payload_size + 8);
  if (needed <= 1.0) {
    return 0u;
  }
  const double bits = std::ceil(std::log2(needed));
  if (!std::isfinite(bits) || bits > MAX_TRAILING_ZEROS + 1) {
    return std::nullopt;
  }
  unsigned tz = static_cast<unsigned>(bits);
  // log2 rounding can land one off in either direction
  while (tz > 0 && ScoreFor(tz - 1, payload_size) >= target_score) {
    --tz;
  }
  while (ScoreFor(tz, payload_size) < target_score) {
    ++tz;
  }
  if (tz > MAX_TRAILING_ZEROS) {
    return std::nullopt;
  }
  return tz;
}

}  // namespace pow
}  // namespace tangle
