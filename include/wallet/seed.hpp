// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace tangle {
namespace wallet {

// Opaque wallet entropy. Bytes are wiped on destruction.
class Seed {
public:
  static constexpr size_t MIN_LENGTH = 32;

  // Throws Error(InvalidParameter) if shorter than MIN_LENGTH
  explicit Seed(std::vector<uint8_t> bytes);
  static Seed FromHex(const std::string& hex);

  Seed(const Seed& other) = default;
  Seed& operator=(const Seed& other) = default;
  ~Seed();

  std::span<const uint8_t> bytes() const { return bytes_; }

private:
  std::vector<uint8_t> bytes_;
};

}  // namespace wallet
}  // namespace tangle
