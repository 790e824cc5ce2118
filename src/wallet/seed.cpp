// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/seed.hpp"

#include "client/error.hpp"
#include "util/hex.hpp"

#include <openssl/crypto.h>

namespace tangle {
namespace wallet {

Seed::Seed(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {
  if (bytes_.size() < MIN_LENGTH) {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
    throw Error(ErrorKind::InvalidParameter,
                "seed must be at least " + std::to_string(MIN_LENGTH) + " bytes, got " + std::to_string(bytes_.size()));
  }
}

Seed Seed::FromHex(const std::string& hex) {
  auto bytes = util::ParseHex(hex);
  if (!bytes) {
    throw Error(ErrorKind::InvalidParameter, "seed is not valid hex");
  }
  return Seed(std::move(*bytes));
}

Seed::~Seed() {
  OPENSSL_cleanse(bytes_.data(), bytes_.size());
}

}  // namespace wallet
}  // namespace tangle
