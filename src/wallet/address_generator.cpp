// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/address_generator.hpp"

#include "client/error.hpp"
#include "util/blake2b.hpp"
#include "util/logging.hpp"
#include "wallet/slip10.hpp"

#include <openssl/crypto.h>

namespace tangle {
namespace wallet {

AddressKeyPair::~AddressKeyPair() {
  OPENSSL_cleanse(private_key.data(), private_key.size());
}

message::Address AddressFromPublicKey(const Ed25519PublicKey& public_key) {
  message::Address address;
  address.type = message::AddressType::Ed25519;
  address.bytes = util::Blake2b256(public_key);
  return address;
}

AddressKeyPair DeriveKeyPair(const Seed& seed, const DerivationPath& path, uint64_t index) {
  if (index >= HARDENED_OFFSET) {
    throw Error(ErrorKind::InvalidParameter, "address index " + std::to_string(index) + " is out of range");
  }
  const ExtendedKey key = ExtendedKey::FromSeed(seed.bytes()).Derive(path.Child(static_cast<uint32_t>(index)));

  AddressKeyPair pair;
  pair.private_key = key.key();
  pair.public_key = Ed25519DerivePublicKey(pair.private_key);
  return pair;
}

message::Address DeriveAddress(const Seed& seed, const DerivationPath& path, uint64_t index) {
  return AddressFromPublicKey(DeriveKeyPair(seed, path, index).public_key);
}

std::vector<message::Address> DeriveAddresses(const Seed& seed, const DerivationPath& path, uint64_t start,
                                              uint64_t end) {
  if (end < start) {
    throw Error(ErrorKind::InvalidParameter,
                "address range end " + std::to_string(end) + " is before start " + std::to_string(start));
  }
  LOG_WALLET_TRACE("deriving addresses [{}, {}) on {}", start, end, path.ToString());

  // Walk the shared prefix once instead of per index
  const ExtendedKey parent = ExtendedKey::FromSeed(seed.bytes()).Derive(path);
  std::vector<message::Address> out;
  out.reserve(end - start);
  for (uint64_t i = start; i < end; ++i) {
    if (i >= HARDENED_OFFSET) {
      throw Error(ErrorKind::InvalidParameter, "address index " + std::to_string(i) + " is out of range");
    }
    const ExtendedKey child = parent.DeriveChild(static_cast<uint32_t>(i), true);
    out.push_back(AddressFromPublicKey(Ed25519DerivePublicKey(child.key())));
  }
  return out;
}

}  // namespace wallet
}  // namespace tangle
