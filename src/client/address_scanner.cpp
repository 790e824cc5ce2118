// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/address_scanner.hpp"

#include "client/error.hpp"
#include "util/logging.hpp"
#include "wallet/address_generator.hpp"

namespace tangle {

const wallet::DerivationPath& RequirePath(const std::optional<wallet::DerivationPath>& path) {
  if (!path) {
    throw Error(ErrorKind::MissingParameter, "BIP32 path");
  }
  return *path;
}

AddressScanner::AddressScanner(api::NodeApi& api, const NodePool& pool, uint64_t batch_size)
    : api_(api), pool_(pool), batch_size_(batch_size) {
  if (batch_size_ == 0) {
    throw Error(ErrorKind::InvalidParameter, "address batch size must be positive");
  }
}

uint64_t AddressScanner::QueryBalance(const message::Address& address) const {
  return api_.GetAddressBalance(pool_.GetNode(), address);
}

message::UnspentAddress AddressScanner::FindUnspentAddress(const wallet::Seed& seed,
                                                           const UnspentAddressOptions& options) const {
  const wallet::DerivationPath& path = RequirePath(options.path);

  uint64_t cursor = options.start_index;
  while (true) {
    const auto batch = wallet::DeriveAddresses(seed, path, cursor, cursor + batch_size_);
    for (uint64_t offset = 0; offset < batch.size(); ++offset) {
      const uint64_t balance = QueryBalance(batch[offset]);
      if (balance == 0) {
        LOG_WALLET_DEBUG("unspent address at index {}", cursor + offset);
        return message::UnspentAddress{batch[offset], cursor + offset};
      }
      LOG_WALLET_TRACE("index {} holds {}", cursor + offset, balance);
    }
    cursor += batch_size_;
  }
}

std::vector<message::Address> AddressScanner::FindAddresses(const wallet::Seed& seed,
                                                            const AddressRangeOptions& options) const {
  const wallet::DerivationPath& path = RequirePath(options.path);
  if (options.end < options.start) {
    throw Error(ErrorKind::InvalidParameter, "address range end is before start");
  }
  return wallet::DeriveAddresses(seed, path, options.start, options.end);
}

uint64_t AddressScanner::GetBalance(const wallet::Seed& seed, const BalanceOptions& options) const {
  const wallet::DerivationPath& path = RequirePath(options.path);

  uint64_t total = 0;
  uint64_t cursor = options.start_index;
  while (true) {
    const auto batch = wallet::DeriveAddresses(seed, path, cursor, cursor + batch_size_);
    for (const auto& address : batch) {
      const uint64_t balance = QueryBalance(address);
      if (balance == 0) {
        return total;
      }
      total += balance;
    }
    cursor += batch_size_;
  }
}

std::vector<message::AddressBalance> AddressScanner::GetAddressBalances(
    const std::vector<message::Address>& addresses) const {
  std::vector<message::AddressBalance> out;
  out.reserve(addresses.size());
  for (const auto& address : addresses) {
    out.push_back(message::AddressBalance{address, QueryBalance(address)});
  }
  return out;
}

}  // namespace tangle
