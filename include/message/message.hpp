// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "message/payload.hpp"
#include "message/types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace tangle {
namespace message {

/**
 * Message - a vertex of the tangle
 *
 * Encoding (little-endian):
 *   network_id   u64
 *   parent1      32 bytes
 *   parent2      32 bytes
 *   payload      u32 length + tagged payload (length 0 = none)
 *   nonce        u64
 *
 * The message id is Blake2b-256 of the full encoding. Proof of work is
 * computed over everything except the trailing nonce.
 */
class Message {
public:
  uint64_t network_id{0};
  MessageId parent1{};
  MessageId parent2{};
  PayloadPtr payload;
  uint64_t nonce{0};

  std::vector<uint8_t> serialize() const;

  // Encoding without the nonce
  std::vector<uint8_t> pow_bytes() const;

  MessageId id() const;

  // Throws Error(InvalidResponse) on malformed input
  static Message Deserialize(std::span<const uint8_t> data);
};

/**
 * MessageBuilder - assembles and validates a Message
 *
 * build() throws Error(TransactionError) when the network id or a parent
 * is missing, or when the encoding exceeds MAX_MESSAGE_LENGTH.
 */
class MessageBuilder {
public:
  MessageBuilder& with_network_id(uint64_t id);
  MessageBuilder& with_parent1(const MessageId& id);
  MessageBuilder& with_parent2(const MessageId& id);
  MessageBuilder& with_payload(PayloadPtr payload);
  MessageBuilder& with_nonce(uint64_t nonce);

  Message build() const;

private:
  std::optional<uint64_t> network_id_;
  std::optional<MessageId> parent1_;
  std::optional<MessageId> parent2_;
  PayloadPtr payload_;
  uint64_t nonce_{0};
};

}  // namespace message
}  // namespace tangle
