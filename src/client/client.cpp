// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/client.hpp"

#include "api/http_node_api.hpp"
#include "client/error.hpp"
#include "client/network_id.hpp"
#include "util/logging.hpp"

#include <set>

namespace tangle {

using namespace message;

namespace {

std::vector<util::NodeUrl> ParseNodes(const std::vector<std::string>& nodes) {
  if (nodes.empty()) {
    throw Error(ErrorKind::MissingParameter, "nodes");
  }
  std::vector<util::NodeUrl> out;
  std::set<util::NodeUrl> seen;
  for (const auto& node : nodes) {
    util::NodeUrl url = util::NodeUrl::Parse(node);
    // The same node written two ways is probed once
    if (seen.insert(url).second) {
      out.push_back(url);
    }
  }
  return out;
}

}  // namespace

Client::Client(ClientConfig config, std::shared_ptr<api::NodeApi> api,
               std::shared_ptr<asio::io_context> external_io_context)
    : config_(std::move(config)), api_(std::move(api)) {
  std::vector<util::NodeUrl> nodes = ParseNodes(config_.nodes);
  if (config_.node_sync_interval.count() <= 0) {
    throw Error(ErrorKind::InvalidParameter, "node sync interval must be positive");
  }
  if (!api_) {
    api_ = std::make_shared<api::HttpNodeApi>(config_.request_timeout);
  }

  pool_ = std::make_unique<NodePool>(*api_, std::move(nodes), std::move(external_io_context));
  scanner_ = std::make_unique<AddressScanner>(*api_, *pool_);
  lifecycle_ = std::make_unique<MessageLifecycle>(*api_, *pool_, GetPowProvider());
  transfer_ = std::make_unique<Transfer>(*api_, *pool_, *scanner_, *lifecycle_);

  // Populate the pool before the client is handed out
  pool_->SyncNow();
  LOG_CLIENT_INFO("client ready: {}/{} nodes healthy", pool_->Snapshot()->size(), pool_->nodes().size());

  if (config_.node_sync_enabled) {
    pool_->Start(config_.node_sync_interval);
  }
}

Client::~Client() {
  try {
    Shutdown();
  } catch (const std::exception& e) {
    LOG_CLIENT_ERROR("client destroyed without a clean shutdown: {}", e.what());
  }
}

void Client::Shutdown() {
  std::lock_guard<std::mutex> lock(shutdown_mutex_);
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  try {
    pool_->Stop();
  } catch (const std::exception& e) {
    LOG_CLIENT_ERROR("failed to stop node sync: {}", e.what());
    throw;
  }
}

util::NodeUrl Client::GetNode() const {
  return pool_->GetNode();
}

uint64_t Client::GetNetworkId() {
  return NetworkIdFromString(GetInfo().network_id);
}

pow::PowProvider Client::GetPowProvider() const {
  return pow::PowProvider(config_.local_pow, config_.pow_worker_count);
}

bool Client::GetNodeHealth(api::NodeApi& api, const std::string& url) {
  return api.GetHealth(util::NodeUrl::Parse(url));
}

NodeInfo Client::GetNodeInfo(api::NodeApi& api, const std::string& url) {
  return api.GetInfo(util::NodeUrl::Parse(url));
}

UnspentAddress Client::GetUnspentAddress(const wallet::Seed& seed, const UnspentAddressOptions& options) {
  return scanner_->FindUnspentAddress(seed, options);
}

std::vector<Address> Client::FindAddresses(const wallet::Seed& seed, const AddressRangeOptions& options) {
  return scanner_->FindAddresses(seed, options);
}

uint64_t Client::GetBalance(const wallet::Seed& seed, const BalanceOptions& options) {
  return scanner_->GetBalance(seed, options);
}

std::vector<AddressBalance> Client::GetAddressBalances(const std::vector<Address>& addresses) {
  return scanner_->GetAddressBalances(addresses);
}

PostedMessage Client::Send(const SendOptions& options) {
  return transfer_->Send(options);
}

PostedMessage Client::Retry(const MessageId& id) {
  return lifecycle_->Retry(id);
}

PostedMessage Client::Promote(const MessageId& id) {
  return lifecycle_->Promote(id);
}

PostedMessage Client::Reattach(const MessageId& id) {
  return lifecycle_->Reattach(id);
}

bool Client::GetHealth() {
  return api_->GetHealth(GetNode());
}

NodeInfo Client::GetInfo() {
  return api_->GetInfo(GetNode());
}

Tips Client::GetTips() {
  return api_->GetTips(GetNode());
}

MessageId Client::PostMessage(const Message& msg) {
  return api_->PostMessage(GetNode(), msg);
}

Message Client::GetMessage(const MessageId& id) {
  return api_->GetMessage(GetNode(), id);
}

MessageMetadata Client::GetMessageMetadata(const MessageId& id) {
  return api_->GetMessageMetadata(GetNode(), id);
}

std::vector<MessageId> Client::GetMessageIdsByIndex(const std::vector<uint8_t>& index) {
  return api_->GetMessageIdsByIndex(GetNode(), index);
}

OutputMetadata Client::GetOutput(const OutputId& id) {
  return api_->GetOutput(GetNode(), id);
}

std::vector<OutputId> Client::GetAddressOutputs(const Address& address) {
  return api_->GetAddressOutputs(GetNode(), address);
}

MilestoneMetadata Client::GetMilestone(uint32_t index) {
  return api_->GetMilestone(GetNode(), index);
}

std::vector<OutputMetadata> Client::FindOutputs(const std::vector<OutputId>& outputs,
                                                const std::vector<Address>& addresses) {
  std::set<OutputId> to_query(outputs.begin(), outputs.end());
  for (const auto& address : addresses) {
    for (const auto& id : GetAddressOutputs(address)) {
      to_query.insert(id);
    }
  }

  std::vector<OutputMetadata> result;
  result.reserve(to_query.size());
  for (const auto& id : to_query) {
    result.push_back(GetOutput(id));
  }
  return result;
}

std::vector<Message> Client::FindMessages(const std::vector<std::string>& index_keys,
                                          const std::vector<MessageId>& ids) {
  std::set<MessageId> to_query(ids.begin(), ids.end());
  for (const auto& key : index_keys) {
    for (const auto& id : GetMessageIdsByIndex(std::vector<uint8_t>(key.begin(), key.end()))) {
      to_query.insert(id);
    }
  }

  std::vector<Message> result;
  result.reserve(to_query.size());
  for (const auto& id : to_query) {
    result.push_back(GetMessage(id));
  }
  return result;
}

}  // namespace tangle
