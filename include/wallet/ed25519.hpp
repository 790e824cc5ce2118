// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace tangle {
namespace wallet {

using Ed25519PrivateKey = std::array<uint8_t, 32>;
using Ed25519PublicKey = std::array<uint8_t, 32>;
using Ed25519Sig = std::array<uint8_t, 64>;

// Ed25519 over OpenSSL's EVP interface. Failures inside OpenSSL throw
// std::runtime_error; they indicate a broken library, not bad input.
Ed25519PublicKey Ed25519DerivePublicKey(const Ed25519PrivateKey& private_key);
Ed25519Sig Ed25519Sign(const Ed25519PrivateKey& private_key, std::span<const uint8_t> message);
bool Ed25519Verify(const Ed25519PublicKey& public_key, std::span<const uint8_t> message, const Ed25519Sig& signature);

}  // namespace wallet
}  // namespace tangle
