// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/node_api.hpp"
#include "client/node_pool.hpp"
#include "message/message.hpp"
#include "pow/pow_provider.hpp"

#include <utility>

namespace tangle {

using PostedMessage = std::pair<message::MessageId, message::Message>;

/**
 * MessageLifecycle - keeps unconfirmed messages moving
 *
 * Promote attaches an empty message on top of a fresh tip and the stuck
 * message; Reattach re-issues the stuck message's payload on fresh tips.
 * Tips, network id and minimum PoW score are fetched after each call
 * begins and never cached, so a retried operation always builds on the
 * current tangle.
 */
class MessageLifecycle {
public:
  MessageLifecycle(api::NodeApi& api, const NodePool& pool, pow::PowProvider pow);

  // Promote if the node says so, else reattach if the node says so, else
  // Error(NoNeedPromoteOrReattach) without posting anything
  PostedMessage Retry(const message::MessageId& id);

  // New message with parents (tip1, id) and no payload
  PostedMessage Promote(const message::MessageId& id);

  // Same payload, parents (tip1, tip2); Error(MissingPayload) if the
  // original message carries none
  PostedMessage Reattach(const message::MessageId& id);

  // Wrap payload in a message on fresh tips and post it
  PostedMessage Submit(message::PayloadPtr payload);

  const pow::PowProvider& pow() const { return pow_; }

private:
  // Fetch node info, set network id, build, solve PoW
  message::Message Finish(message::MessageBuilder& builder);
  PostedMessage Post(const message::Message& msg);

  api::NodeApi& api_;
  const NodePool& pool_;
  pow::PowProvider pow_;
};

}  // namespace tangle
