// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/node_api.hpp"
#include "client/node_pool.hpp"
#include "message/types.hpp"
#include "wallet/derivation_path.hpp"
#include "wallet/seed.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace tangle {

struct UnspentAddressOptions {
  std::optional<wallet::DerivationPath> path;
  uint64_t start_index{0};
};

struct AddressRangeOptions {
  std::optional<wallet::DerivationPath> path;
  uint64_t start{0};
  uint64_t end{20};
};

struct BalanceOptions {
  std::optional<wallet::DerivationPath> path;
  uint64_t start_index{0};
};

/**
 * AddressScanner - deterministic address discovery against live balances
 *
 * Addresses are derived in batches of batch_size consecutive indices and
 * their balances queried in index order. Balances are always fetched
 * fresh; any balance query error aborts the whole operation.
 */
class AddressScanner {
public:
  static constexpr uint64_t DEFAULT_BATCH_SIZE = 20;

  AddressScanner(api::NodeApi& api, const NodePool& pool, uint64_t batch_size = DEFAULT_BATCH_SIZE);

  // First address at or after start_index whose balance is exactly zero.
  // Throws Error(MissingParameter, "BIP32 path") before any request if no
  // path is given. The scan has no upper bound: a seed whose every address
  // holds funds keeps the caller scanning.
  message::UnspentAddress FindUnspentAddress(const wallet::Seed& seed, const UnspentAddressOptions& options) const;

  // Addresses for [start, end). No network access.
  std::vector<message::Address> FindAddresses(const wallet::Seed& seed, const AddressRangeOptions& options) const;

  // Sum of balances from start_index up to (not including) the first
  // zero-balance address
  uint64_t GetBalance(const wallet::Seed& seed, const BalanceOptions& options) const;

  std::vector<message::AddressBalance> GetAddressBalances(const std::vector<message::Address>& addresses) const;

  uint64_t batch_size() const { return batch_size_; }

private:
  uint64_t QueryBalance(const message::Address& address) const;

  api::NodeApi& api_;
  const NodePool& pool_;
  uint64_t batch_size_;
};

// Throws Error(MissingParameter, "BIP32 path") when absent
const wallet::DerivationPath& RequirePath(const std::optional<wallet::DerivationPath>& path);

}  // namespace tangle
