// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tangle {
namespace util {

// Lowercase hex encoding
std::string HexStr(std::span<const uint8_t> data);

// Decode hex (either case, optional "0x" prefix). Returns nullopt on odd
// length or non-hex characters.
std::optional<std::vector<uint8_t>> ParseHex(std::string_view hex);

// Decode hex into exactly N bytes
template <size_t N>
std::optional<std::array<uint8_t, N>> ParseHexFixed(std::string_view hex) {
  auto bytes = ParseHex(hex);
  if (!bytes || bytes->size() != N) {
    return std::nullopt;
  }
  std::array<uint8_t, N> out{};
  std::copy(bytes->begin(), bytes->end(), out.begin());
  return out;
}

}  // namespace util
}  // namespace tangle
