// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/blake2b.hpp"

#include <stdexcept>

#include <blake2.h>

namespace tangle {
namespace util {

Hash256 Blake2b256(std::span<const uint8_t> data) {
  Hash256 out{};
  if (blake2b(out.data(), out.size(), data.data(), data.size(), nullptr, 0) != 0) {
    throw std::runtime_error("blake2b failed");
  }
  return out;
}

}  // namespace util
}  // namespace tangle
