// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/node_api.hpp"
#include "client/address_scanner.hpp"
#include "client/config.hpp"
#include "client/message_lifecycle.hpp"
#include "client/node_pool.hpp"
#include "client/transfer.hpp"
#include "pow/pow_provider.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <asio/io_context.hpp>

namespace tangle {

/**
 * Client - one logical endpoint over a set of independent nodes
 *
 * Construction validates the configuration, probes every node once so the
 * pool is populated before the first call, and starts background
 * re-probing when node_sync_enabled. Every operation picks its node from
 * the pool at call time.
 *
 * Shutdown() (also run by the destructor) stops the background sync and
 * joins its thread. It is idempotent.
 */
class Client {
public:
  // api defaults to HttpNodeApi with config.request_timeout; io_context
  // defaults to one owned by the node pool
  explicit Client(ClientConfig config, std::shared_ptr<api::NodeApi> api = nullptr,
                  std::shared_ptr<asio::io_context> external_io_context = nullptr);
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  void Shutdown();

  // Node selection and network parameters
  util::NodeUrl GetNode() const;
  uint64_t GetNetworkId();
  pow::PowProvider GetPowProvider() const;

  // Probe a node outside the pool
  static bool GetNodeHealth(api::NodeApi& api, const std::string& url);
  static message::NodeInfo GetNodeInfo(api::NodeApi& api, const std::string& url);

  // Address discovery
  message::UnspentAddress GetUnspentAddress(const wallet::Seed& seed, const UnspentAddressOptions& options);
  std::vector<message::Address> FindAddresses(const wallet::Seed& seed, const AddressRangeOptions& options);
  uint64_t GetBalance(const wallet::Seed& seed, const BalanceOptions& options);
  std::vector<message::AddressBalance> GetAddressBalances(const std::vector<message::Address>& addresses);

  // Message lifecycle
  PostedMessage Send(const SendOptions& options);
  PostedMessage Retry(const message::MessageId& id);
  PostedMessage Promote(const message::MessageId& id);
  PostedMessage Reattach(const message::MessageId& id);

  // Node endpoints on the pool's current node
  bool GetHealth();
  message::NodeInfo GetInfo();
  message::Tips GetTips();
  message::MessageId PostMessage(const message::Message& msg);
  message::Message GetMessage(const message::MessageId& id);
  message::MessageMetadata GetMessageMetadata(const message::MessageId& id);
  std::vector<message::MessageId> GetMessageIdsByIndex(const std::vector<uint8_t>& index);
  message::OutputMetadata GetOutput(const message::OutputId& id);
  std::vector<message::OutputId> GetAddressOutputs(const message::Address& address);
  message::MilestoneMetadata GetMilestone(uint32_t index);

  // Metadata for the given outputs plus every output of the given
  // addresses, each fetched once
  std::vector<message::OutputMetadata> FindOutputs(const std::vector<message::OutputId>& outputs,
                                                   const std::vector<message::Address>& addresses);

  // The given messages plus every message filed under the index keys, each
  // fetched once
  std::vector<message::Message> FindMessages(const std::vector<std::string>& index_keys,
                                             const std::vector<message::MessageId>& ids);

  const ClientConfig& config() const { return config_; }
  NodePool& pool() { return *pool_; }

private:
  ClientConfig config_;
  std::shared_ptr<api::NodeApi> api_;
  std::unique_ptr<NodePool> pool_;
  std::unique_ptr<AddressScanner> scanner_;
  std::unique_ptr<MessageLifecycle> lifecycle_;
  std::unique_ptr<Transfer> transfer_;

  std::mutex shutdown_mutex_;
  bool shut_down_{false};
};

}  // namespace tangle
