// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "message/message.hpp"

#include "client/error.hpp"
#include "util/blake2b.hpp"

namespace tangle {
namespace message {

namespace {

void WriteWithoutNonce(const Message& m, MessageSerializer& s) {
  s.write_uint64(m.network_id);
  s.write_bytes(m.parent1);
  s.write_bytes(m.parent2);
  if (m.payload) {
    s.write_prefixed32(m.payload->serialize());
  } else {
    s.write_uint32(0);
  }
}

}  // namespace

std::vector<uint8_t> Message::serialize() const {
  MessageSerializer s;
  WriteWithoutNonce(*this, s);
  s.write_uint64(nonce);
  return s.release();
}

std::vector<uint8_t> Message::pow_bytes() const {
  MessageSerializer s;
  WriteWithoutNonce(*this, s);
  return s.release();
}

MessageId Message::id() const {
  return util::Blake2b256(serialize());
}

Message Message::Deserialize(std::span<const uint8_t> data) {
  if (data.size() > MAX_MESSAGE_LENGTH) {
    throw Error(ErrorKind::InvalidResponse, "message exceeds " + std::to_string(MAX_MESSAGE_LENGTH) + " bytes");
  }

  MessageDeserializer d(data);
  Message m;
  m.network_id = d.read_uint64();
  m.parent1 = d.read_array<MESSAGE_ID_LENGTH>();
  m.parent2 = d.read_array<MESSAGE_ID_LENGTH>();
  auto payload_bytes = d.read_prefixed32();
  m.nonce = d.read_uint64();

  if (d.has_error() || d.bytes_remaining() != 0) {
    throw Error(ErrorKind::InvalidResponse, "truncated or oversized message encoding");
  }
  if (!payload_bytes.empty()) {
    m.payload = DeserializePayload(payload_bytes);
    if (!m.payload) {
      throw Error(ErrorKind::InvalidResponse, "malformed message payload");
    }
  }
  return m;
}

MessageBuilder& MessageBuilder::with_network_id(uint64_t id) {
  network_id_ = id;
  return *this;
}

MessageBuilder& MessageBuilder::with_parent1(const MessageId& id) {
  parent1_ = id;
  return *this;
}

MessageBuilder& MessageBuilder::with_parent2(const MessageId& id) {
  parent2_ = id;
  return *this;
}

MessageBuilder& MessageBuilder::with_payload(PayloadPtr payload) {
  payload_ = std::move(payload);
  return *this;
}

MessageBuilder& MessageBuilder::with_nonce(uint64_t nonce) {
  nonce_ = nonce;
  return *this;
}

Message MessageBuilder::build() const {
  if (!network_id_) {
    throw Error(ErrorKind::TransactionError, "message builder: network id not set");
  }
  if (!parent1_ || !parent2_) {
    throw Error(ErrorKind::TransactionError, "message builder: both parents are required");
  }

  if (auto indexation = std::dynamic_pointer_cast<const IndexationPayload>(payload_)) {
    if (indexation->index.empty() || indexation->index.size() > IndexationPayload::MAX_INDEX_LENGTH) {
      throw Error(ErrorKind::TransactionError, "message builder: indexation key must be 1.." +
                                                   std::to_string(IndexationPayload::MAX_INDEX_LENGTH) + " bytes");
    }
  }

  Message m;
  m.network_id = *network_id_;
  m.parent1 = *parent1_;
  m.parent2 = *parent2_;
  m.payload = payload_;
  m.nonce = nonce_;

  const size_t length = m.serialize().size();
  if (length > MAX_MESSAGE_LENGTH) {
    throw Error(ErrorKind::TransactionError, "message builder: encoding is " + std::to_string(length) +
                                                 " bytes, limit " + std::to_string(MAX_MESSAGE_LENGTH));
  }
  return m;
}

}  // namespace message
}  // namespace tangle
