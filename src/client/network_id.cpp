// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/network_id.hpp"

#include "util/blake2b.hpp"

#include <span>

namespace tangle {

uint64_t NetworkIdFromString(const std::string& network_name) {
  const auto digest =
      util::Blake2b256(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(network_name.data()), network_name.size()));
  uint64_t id = 0;
  for (int i = 7; i >= 0; --i) {
    id = (id << 8) | digest[i];
  }
  return id;
}

}  // namespace tangle
