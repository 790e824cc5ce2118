// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "message/types.hpp"
#include "wallet/derivation_path.hpp"
#include "wallet/ed25519.hpp"
#include "wallet/seed.hpp"

#include <cstdint>
#include <vector>

namespace tangle {
namespace wallet {

// Private/public key pair for one address index. The private half is wiped
// on destruction.
struct AddressKeyPair {
  Ed25519PrivateKey private_key{};
  Ed25519PublicKey public_key{};

  AddressKeyPair() = default;
  AddressKeyPair(const AddressKeyPair&) = default;
  AddressKeyPair& operator=(const AddressKeyPair&) = default;
  ~AddressKeyPair();
};

// Blake2b-256 of the public key, tagged Ed25519
message::Address AddressFromPublicKey(const Ed25519PublicKey& public_key);

// Keys at path/index' (index appended as a hardened segment)
AddressKeyPair DeriveKeyPair(const Seed& seed, const DerivationPath& path, uint64_t index);

message::Address DeriveAddress(const Seed& seed, const DerivationPath& path, uint64_t index);

// Addresses for indices [start, end); throws InvalidParameter if end < start
std::vector<message::Address> DeriveAddresses(const Seed& seed, const DerivationPath& path, uint64_t start,
                                              uint64_t end);

}  // namespace wallet
}  // namespace tangle
