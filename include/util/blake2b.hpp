// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace tangle {
namespace util {

using Hash256 = std::array<uint8_t, 32>;

// Unkeyed Blake2b with a 32-byte digest. Addresses, message ids, network
// ids and the proof-of-work score are all Blake2b-256 digests.
Hash256 Blake2b256(std::span<const uint8_t> data);

}  // namespace util
}  // namespace tangle
