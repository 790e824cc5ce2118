// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/http_client.hpp"
#include "api/node_api.hpp"

#include <chrono>

#include <nlohmann/json.hpp>

namespace tangle {
namespace api {

// NodeApi over the node's HTTP/JSON REST interface (/health, /api/v1/...)
class HttpNodeApi : public NodeApi {
public:
  explicit HttpNodeApi(std::chrono::milliseconds request_timeout);

  bool GetHealth(const util::NodeUrl& node) override;
  message::NodeInfo GetInfo(const util::NodeUrl& node) override;
  message::Tips GetTips(const util::NodeUrl& node) override;
  message::MessageId PostMessage(const util::NodeUrl& node, const message::Message& msg) override;
  message::Message GetMessage(const util::NodeUrl& node, const message::MessageId& id) override;
  message::MessageMetadata GetMessageMetadata(const util::NodeUrl& node, const message::MessageId& id) override;
  std::vector<message::MessageId> GetMessageIdsByIndex(const util::NodeUrl& node,
                                                       const std::vector<uint8_t>& index) override;
  uint64_t GetAddressBalance(const util::NodeUrl& node, const message::Address& address) override;
  std::vector<message::OutputId> GetAddressOutputs(const util::NodeUrl& node,
                                                   const message::Address& address) override;
  message::OutputMetadata GetOutput(const util::NodeUrl& node, const message::OutputId& id) override;
  message::MilestoneMetadata GetMilestone(const util::NodeUrl& node, uint32_t index) override;

private:
  // GET path, require status 200, return the "data" object
  nlohmann::json GetData(const util::NodeUrl& node, const std::string& path);

  HttpClient http_;
};

}  // namespace api
}  // namespace tangle
