// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/derivation_path.hpp"

#include "client/error.hpp"

#include <charconv>

namespace tangle {
namespace wallet {

namespace {

// Deeper paths are never used by wallets and only cost derivation time
constexpr size_t MAX_DEPTH = 255;

[[noreturn]] void Reject(const std::string& text, const std::string& why) {
  throw Error(ErrorKind::InvalidParameter, "derivation path '" + text + "': " + why);
}

}  // namespace

DerivationPath::DerivationPath(std::vector<PathSegment> segments) : segments_(std::move(segments)) {
  for (const auto& s : segments_) {
    if (s.index >= HARDENED_OFFSET) {
      throw Error(ErrorKind::InvalidParameter, "derivation path segment out of range");
    }
  }
}

DerivationPath DerivationPath::Parse(const std::string& text) {
  if (text.empty() || (text[0] != 'm' && text[0] != 'M')) {
    Reject(text, "must start with 'm'");
  }
  if (text.size() == 1) {
    return DerivationPath();
  }
  if (text[1] != '/') {
    Reject(text, "expected '/' after 'm'");
  }

  std::vector<PathSegment> segments;
  size_t pos = 2;
  while (true) {
    const size_t slash = text.find('/', pos);
    std::string part = text.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
    if (part.empty()) {
      Reject(text, "empty segment");
    }

    PathSegment seg;
    const char last = part.back();
    if (last == '\'' || last == 'h' || last == 'H') {
      seg.hardened = true;
      part.pop_back();
    }
    if (part.empty() || part.size() > 10) {
      Reject(text, "bad segment");
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
    if (ec != std::errc{} || ptr != part.data() + part.size()) {
      Reject(text, "segment '" + part + "' is not a number");
    }
    if (value >= HARDENED_OFFSET) {
      Reject(text, "segment '" + part + "' is out of range");
    }
    seg.index = static_cast<uint32_t>(value);
    segments.push_back(seg);
    if (segments.size() > MAX_DEPTH) {
      Reject(text, "too deep");
    }

    if (slash == std::string::npos) {
      break;
    }
    pos = slash + 1;
  }
  return DerivationPath(std::move(segments));
}

DerivationPath DerivationPath::Child(uint32_t index, bool hardened) const {
  if (index >= HARDENED_OFFSET) {
    throw Error(ErrorKind::InvalidParameter, "address index " + std::to_string(index) + " is out of range");
  }
  DerivationPath out = *this;
  out.segments_.push_back(PathSegment{index, hardened});
  return out;
}

std::string DerivationPath::ToString() const {
  std::string out = "m";
  for (const auto& s : segments_) {
    out += "/" + std::to_string(s.index);
    if (s.hardened) {
      out += "'";
    }
  }
  return out;
}

}  // namespace wallet
}  // namespace tangle
