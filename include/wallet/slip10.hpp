// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "wallet/derivation_path.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace tangle {
namespace wallet {

/**
 * SLIP-0010 key derivation for Ed25519
 *
 *   master  = HMAC-SHA512("ed25519 seed", seed)
 *   child_i = HMAC-SHA512(chain_code, 0x00 || key || ser32(i + 2^31))
 *
 * Left half is the key, right half the chain code. Ed25519 only defines
 * hardened children; a non-hardened segment is rejected.
 */
class ExtendedKey {
public:
  using Bytes32 = std::array<uint8_t, 32>;

  ExtendedKey(const Bytes32& key, const Bytes32& chain_code) : key_(key), chain_code_(chain_code) {}
  ExtendedKey(const ExtendedKey&) = default;
  ExtendedKey& operator=(const ExtendedKey&) = default;
  ~ExtendedKey();

  static ExtendedKey FromSeed(std::span<const uint8_t> seed);

  // Throws Error(InvalidParameter) if !hardened
  ExtendedKey DeriveChild(uint32_t index, bool hardened) const;

  ExtendedKey Derive(const DerivationPath& path) const;

  const Bytes32& key() const { return key_; }
  const Bytes32& chain_code() const { return chain_code_; }

private:
  Bytes32 key_;
  Bytes32 chain_code_;
};

}  // namespace wallet
}  // namespace tangle
