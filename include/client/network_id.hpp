// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace tangle {

// Numeric network id carried in every message: the first 8 bytes of
// Blake2b-256(network_name) read as a little-endian u64.
uint64_t NetworkIdFromString(const std::string& network_name);

}  // namespace tangle
