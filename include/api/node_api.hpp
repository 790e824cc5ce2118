// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "message/message.hpp"
#include "message/types.hpp"
#include "util/node_url.hpp"

#include <cstdint>
#include <vector>

namespace tangle {
namespace api {

/**
 * NodeApi - the REST endpoints of a single node
 *
 * Every call names its target node explicitly; choosing a node is the
 * caller's business (normally NodePool::GetNode()). Implementations throw
 * tangle::Error: NetworkError for transport failures, ResponseError for
 * unexpected HTTP statuses, InvalidResponse for undecodable bodies.
 *
 * Implementations must be safe to call from several threads at once: the
 * node pool probes health from its own thread while callers use the
 * remaining endpoints.
 */
class NodeApi {
public:
  virtual ~NodeApi() = default;

  // true only for an explicit healthy answer; never throws for an
  // unhealthy node, only for transport failures
  virtual bool GetHealth(const util::NodeUrl& node) = 0;

  virtual message::NodeInfo GetInfo(const util::NodeUrl& node) = 0;
  virtual message::Tips GetTips(const util::NodeUrl& node) = 0;
  virtual message::MessageId PostMessage(const util::NodeUrl& node, const message::Message& msg) = 0;
  virtual message::Message GetMessage(const util::NodeUrl& node, const message::MessageId& id) = 0;
  virtual message::MessageMetadata GetMessageMetadata(const util::NodeUrl& node, const message::MessageId& id) = 0;
  virtual std::vector<message::MessageId> GetMessageIdsByIndex(const util::NodeUrl& node,
                                                               const std::vector<uint8_t>& index) = 0;
  virtual uint64_t GetAddressBalance(const util::NodeUrl& node, const message::Address& address) = 0;
  virtual std::vector<message::OutputId> GetAddressOutputs(const util::NodeUrl& node,
                                                           const message::Address& address) = 0;
  virtual message::OutputMetadata GetOutput(const util::NodeUrl& node, const message::OutputId& id) = 0;
  virtual message::MilestoneMetadata GetMilestone(const util::NodeUrl& node, uint32_t index) = 0;
};

}  // namespace api
}  // namespace tangle
