// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/node_api.hpp"
#include "client/address_scanner.hpp"
#include "client/message_lifecycle.hpp"
#include "client/node_pool.hpp"
#include "message/types.hpp"
#include "wallet/derivation_path.hpp"
#include "wallet/seed.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace tangle {

struct TransferOutput {
  message::Address address;
  uint64_t amount{0};
};

struct IndexationOptions {
  std::vector<uint8_t> index;
  std::vector<uint8_t> data;
};

struct SendOptions {
  std::optional<wallet::Seed> seed;
  std::optional<wallet::DerivationPath> path;
  uint64_t start_index{0};
  std::vector<TransferOutput> outputs;
  std::optional<IndexationOptions> indexation;
};

/**
 * Transfer - builds and posts value transfers and indexation messages
 *
 * Inputs are gathered from the seed's addresses starting at start_index
 * until they cover the requested outputs; a zero-balance address ends the
 * search. Any surplus goes back to the first unspent address at or after
 * the last address used.
 */
class Transfer {
public:
  Transfer(api::NodeApi& api, const NodePool& pool, const AddressScanner& scanner, MessageLifecycle& lifecycle);

  PostedMessage Send(const SendOptions& options);

private:
  struct SelectedInput {
    message::OutputId output;
    uint64_t address_index{0};
    uint64_t amount{0};
  };

  std::vector<SelectedInput> CollectInputs(const wallet::Seed& seed, const wallet::DerivationPath& path,
                                           uint64_t start_index, uint64_t needed, uint64_t& scan_end) const;

  api::NodeApi& api_;
  const NodePool& pool_;
  const AddressScanner& scanner_;
  MessageLifecycle& lifecycle_;
};

}  // namespace tangle
