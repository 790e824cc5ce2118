// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/message_lifecycle.hpp"

#include "client/error.hpp"
#include "client/network_id.hpp"
#include "util/logging.hpp"

namespace tangle {

using message::MessageBuilder;
using message::MessageId;

MessageLifecycle::MessageLifecycle(api::NodeApi& api, const NodePool& pool, pow::PowProvider pow)
    : api_(api), pool_(pool), pow_(pow) {}

PostedMessage MessageLifecycle::Retry(const MessageId& id) {
  const auto metadata = api_.GetMessageMetadata(pool_.GetNode(), id);
  if (metadata.should_promote.value_or(false)) {
    LOG_CLIENT_DEBUG("retry {}: promoting", message::ToHex(id));
    return Promote(id);
  }
  if (metadata.should_reattach.value_or(false)) {
    LOG_CLIENT_DEBUG("retry {}: reattaching", message::ToHex(id));
    return Reattach(id);
  }
  throw Error(ErrorKind::NoNeedPromoteOrReattach, message::ToHex(id));
}

PostedMessage MessageLifecycle::Promote(const MessageId& id) {
  const auto tips = api_.GetTips(pool_.GetNode());
  MessageBuilder builder;
  builder.with_parent1(tips.tip1).with_parent2(id);
  return Post(Finish(builder));
}

PostedMessage MessageLifecycle::Reattach(const MessageId& id) {
  const auto original = api_.GetMessage(pool_.GetNode(), id);
  if (!original.payload) {
    throw Error(ErrorKind::MissingPayload, "message " + message::ToHex(id) + " has no payload to reattach");
  }
  const auto tips = api_.GetTips(pool_.GetNode());
  MessageBuilder builder;
  builder.with_parent1(tips.tip1).with_parent2(tips.tip2).with_payload(original.payload);
  return Post(Finish(builder));
}

PostedMessage MessageLifecycle::Submit(message::PayloadPtr payload) {
  const auto tips = api_.GetTips(pool_.GetNode());
  MessageBuilder builder;
  builder.with_parent1(tips.tip1).with_parent2(tips.tip2).with_payload(std::move(payload));
  return Post(Finish(builder));
}

message::Message MessageLifecycle::Finish(MessageBuilder& builder) {
  const auto info = api_.GetInfo(pool_.GetNode());
  builder.with_network_id(NetworkIdFromString(info.network_id)).with_nonce(0);

  message::Message msg = builder.build();
  msg.nonce = pow_.Nonce(msg.pow_bytes(), info.min_pow_score);
  return msg;
}

PostedMessage MessageLifecycle::Post(const message::Message& msg) {
  const MessageId id = api_.PostMessage(pool_.GetNode(), msg);
  LOG_CLIENT_INFO("posted message {}", message::ToHex(id));
  return {id, msg};
}

}  // namespace tangle
