// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tangle {
namespace wallet {

constexpr uint32_t HARDENED_OFFSET = 0x80000000u;

struct PathSegment {
  uint32_t index{0};  // without the hardened bit
  bool hardened{false};

  bool operator==(const PathSegment&) const = default;
};

/**
 * DerivationPath - BIP32-style path such as m/44'/4218'/0'/0'
 *
 * "'" or "h" after a segment marks it hardened. Segment values must be
 * below 2^31. The bare "m" is the empty path.
 */
class DerivationPath {
public:
  DerivationPath() = default;
  explicit DerivationPath(std::vector<PathSegment> segments);

  // Throws Error(InvalidParameter) on malformed input
  static DerivationPath Parse(const std::string& text);

  const std::vector<PathSegment>& segments() const { return segments_; }

  // Copy of this path with one more segment
  DerivationPath Child(uint32_t index, bool hardened = true) const;

  std::string ToString() const;

  bool operator==(const DerivationPath&) const = default;

private:
  std::vector<PathSegment> segments_;
};

}  // namespace wallet
}  // namespace tangle
