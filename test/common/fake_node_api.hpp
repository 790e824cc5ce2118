// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// In-memory NodeApi for client tests

#pragma once

#include "api/node_api.hpp"
#include "client/error.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tangle {
namespace test {

inline message::MessageId MakeId(uint8_t fill) {
  message::MessageId id{};
  id.fill(fill);
  return id;
}

/**
 * FakeNodeApi - scripted node responses
 *
 * Nodes are healthy unless listed in unhealthy or unreachable. Address
 * balances default to zero. Each GetTips() call hands out the next pair
 * from tips_sequence (the last pair repeats). Every call is counted; posted
 * messages are recorded in order.
 */
class FakeNodeApi : public api::NodeApi {
public:
  // Health
  std::set<std::string> unhealthy;    // answers "not healthy"
  std::set<std::string> unreachable;  // throws NetworkError
  std::function<void(const util::NodeUrl&)> on_health;

  // Node info
  std::string network_id{"testnet"};
  double min_pow_score{4000.0};

  // Tips
  std::vector<message::Tips> tips_sequence{message::Tips{MakeId(0xA1), MakeId(0xA2)}};

  // Ledger
  std::map<message::Address, uint64_t> balances;
  std::map<message::Address, std::vector<message::OutputId>> address_outputs;
  std::map<message::OutputId, message::OutputMetadata> outputs;
  std::optional<std::string> balance_failure;  // GetAddressBalance throws NetworkError

  // Messages
  std::map<message::MessageId, message::Message> messages;
  std::map<message::MessageId, message::MessageMetadata> metadata;
  std::map<std::vector<uint8_t>, std::vector<message::MessageId>> index;
  std::map<uint32_t, message::MilestoneMetadata> milestones;

  bool GetHealth(const util::NodeUrl& node) override {
    ++health_calls;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      probed_.push_back(node.str());
    }
    if (on_health) {
      on_health(node);
    }
    if (unreachable.count(node.str())) {
      throw Error(ErrorKind::NetworkError, "connection refused: " + node.str());
    }
    return unhealthy.count(node.str()) == 0;
  }

  message::NodeInfo GetInfo(const util::NodeUrl&) override {
    ++info_calls;
    message::NodeInfo info;
    info.name = "fake";
    info.version = "0.0.0";
    info.is_healthy = true;
    info.network_id = network_id;
    info.min_pow_score = min_pow_score;
    return info;
  }

  message::Tips GetTips(const util::NodeUrl&) override {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t n = tips_calls_++;
    return tips_sequence.at(std::min(n, tips_sequence.size() - 1));
  }

  message::MessageId PostMessage(const util::NodeUrl&, const message::Message& msg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    posted_.push_back(msg);
    return msg.id();
  }

  message::Message GetMessage(const util::NodeUrl&, const message::MessageId& id) override {
    auto it = messages.find(id);
    if (it == messages.end()) {
      throw Error(ErrorKind::ResponseError, "404: message not found");
    }
    return it->second;
  }

  message::MessageMetadata GetMessageMetadata(const util::NodeUrl&, const message::MessageId& id) override {
    auto it = metadata.find(id);
    if (it == metadata.end()) {
      throw Error(ErrorKind::ResponseError, "404: metadata not found");
    }
    return it->second;
  }

  std::vector<message::MessageId> GetMessageIdsByIndex(const util::NodeUrl&,
                                                       const std::vector<uint8_t>& key) override {
    auto it = index.find(key);
    return it == index.end() ? std::vector<message::MessageId>{} : it->second;
  }

  uint64_t GetAddressBalance(const util::NodeUrl&, const message::Address& address) override {
    ++balance_calls;
    if (balance_failure) {
      throw Error(ErrorKind::NetworkError, *balance_failure);
    }
    auto it = balances.find(address);
    return it == balances.end() ? 0 : it->second;
  }

  std::vector<message::OutputId> GetAddressOutputs(const util::NodeUrl&, const message::Address& address) override {
    auto it = address_outputs.find(address);
    return it == address_outputs.end() ? std::vector<message::OutputId>{} : it->second;
  }

  message::OutputMetadata GetOutput(const util::NodeUrl&, const message::OutputId& id) override {
    ++output_calls;
    auto it = outputs.find(id);
    if (it == outputs.end()) {
      throw Error(ErrorKind::ResponseError, "404: output not found");
    }
    return it->second;
  }

  message::MilestoneMetadata GetMilestone(const util::NodeUrl&, uint32_t idx) override {
    auto it = milestones.find(idx);
    if (it == milestones.end()) {
      throw Error(ErrorKind::ResponseError, "404: milestone not found");
    }
    return it->second;
  }

  // Register an unspent output of amount for address
  message::OutputId AddOutput(const message::Address& address, uint64_t amount, uint8_t tx_fill, uint16_t idx = 0) {
    message::OutputId id;
    id.transaction_id.fill(tx_fill);
    id.index = idx;
    message::OutputMetadata meta;
    meta.transaction_id = id.transaction_id;
    meta.output_index = idx;
    meta.amount = amount;
    meta.address = address;
    outputs[id] = meta;
    address_outputs[address].push_back(id);
    balances[address] += amount;
    return id;
  }

  std::vector<message::Message> posted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return posted_;
  }

  std::vector<std::string> probed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probed_;
  }

  size_t tips_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tips_calls_;
  }

  std::atomic<size_t> health_calls{0};
  std::atomic<size_t> info_calls{0};
  std::atomic<size_t> balance_calls{0};
  std::atomic<size_t> output_calls{0};

private:
  mutable std::mutex mutex_;
  std::vector<message::Message> posted_;
  std::vector<std::string> probed_;
  size_t tips_calls_{0};
};

}  // namespace test
}  // namespace tangle
