// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/blake2b.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace tangle {
namespace pow {

/*
 Proof-of-work scoring

   pow_digest = Blake2b-256(payload)
   h          = Blake2b-256(pow_digest || le64(nonce))
   tz         = trailing zero bits of h, counted from bit 0 of the last byte
   score      = 2^tz / (payload.size() + 8)

 The "+ 8" accounts for the nonce that completes the message encoding.
*/

// Digest reused for every nonce tried against one payload
util::Hash256 PowDigest(std::span<const uint8_t> payload);

// Trailing zero bits of Blake2b-256(pow_digest || le64(nonce))
unsigned TrailingZeros(const util::Hash256& pow_digest, uint64_t nonce);

double Score(std::span<const uint8_t> payload, uint64_t nonce);

// Smallest tz whose score meets target for a payload of this size.
// nullopt if target is non-finite or <= 0, or more than 256 bits would be
// needed.
std::optional<unsigned> RequiredTrailingZeros(size_t payload_size, double target_score);

}  // namespace pow
}  // namespace tangle
