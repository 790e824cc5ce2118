// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/slip10.hpp"

#include "client/error.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace tangle {
namespace wallet {

namespace {

constexpr char kCurveKey[] = "ed25519 seed";

std::array<uint8_t, 64> HmacSha512(const uint8_t* key, size_t key_len, const uint8_t* data, size_t data_len) {
  std::array<uint8_t, 64> out{};
  unsigned int out_len = static_cast<unsigned int>(out.size());
  if (HMAC(EVP_sha512(), key, static_cast<int>(key_len), data, data_len, out.data(), &out_len) == nullptr ||
      out_len != out.size()) {
    throw std::runtime_error("HMAC-SHA512 failed");
  }
  return out;
}

ExtendedKey Split(std::array<uint8_t, 64>& digest) {
  ExtendedKey::Bytes32 key{};
  ExtendedKey::Bytes32 chain{};
  std::copy(digest.begin(), digest.begin() + 32, key.begin());
  std::copy(digest.begin() + 32, digest.end(), chain.begin());
  OPENSSL_cleanse(digest.data(), digest.size());
  ExtendedKey result(key, chain);
  OPENSSL_cleanse(key.data(), key.size());
  OPENSSL_cleanse(chain.data(), chain.size());
  return result;
}

}  // namespace

ExtendedKey::~ExtendedKey() {
  OPENSSL_cleanse(key_.data(), key_.size());
  OPENSSL_cleanse(chain_code_.data(), chain_code_.size());
}

ExtendedKey ExtendedKey::FromSeed(std::span<const uint8_t> seed) {
  auto digest = HmacSha512(reinterpret_cast<const uint8_t*>(kCurveKey), std::strlen(kCurveKey), seed.data(),
                           seed.size());
  return Split(digest);
}

ExtendedKey ExtendedKey::DeriveChild(uint32_t index, bool hardened) const {
  if (!hardened) {
    throw Error(ErrorKind::InvalidParameter, "ed25519 derivation supports hardened segments only");
  }
  if (index >= HARDENED_OFFSET) {
    throw Error(ErrorKind::InvalidParameter, "derivation index out of range");
  }
  const uint32_t i = index | HARDENED_OFFSET;

  std::array<uint8_t, 37> data{};
  data[0] = 0x00;
  std::copy(key_.begin(), key_.end(), data.begin() + 1);
  data[33] = static_cast<uint8_t>(i >> 24);
  data[34] = static_cast<uint8_t>(i >> 16);
  data[35] = static_cast<uint8_t>(i >> 8);
  data[36] = static_cast<uint8_t>(i);

  auto digest = HmacSha512(chain_code_.data(), chain_code_.size(), data.data(), data.size());
  OPENSSL_cleanse(data.data(), data.size());
  return Split(digest);
}

ExtendedKey ExtendedKey::Derive(const DerivationPath& path) const {
  ExtendedKey current = *this;
  for (const auto& segment : path.segments()) {
    current = current.DeriveChild(segment.index, segment.hardened);
  }
  return current;
}

}  // namespace wallet
}  // namespace tangle
