// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "message/serializer.hpp"
#include "message/types.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace tangle {
namespace message {

enum class PayloadType : uint32_t {
  Transaction = 0,
  Milestone = 1,
  Indexation = 2,
};

// Base class for all message payloads
class Payload {
public:
  virtual ~Payload() = default;

  virtual PayloadType type() const = 0;

  // Encode everything after the type tag
  virtual void serialize_body(MessageSerializer& s) const = 0;

  // Type tag (u32) followed by the body
  std::vector<uint8_t> serialize() const;
};

using PayloadPtr = std::shared_ptr<const Payload>;

// Decode a tagged payload. Returns nullptr if the bytes are malformed,
// trailing bytes included.
PayloadPtr DeserializePayload(std::span<const uint8_t> data);

// INDEXATION - arbitrary data filed under an index key
class IndexationPayload : public Payload {
public:
  static constexpr size_t MAX_INDEX_LENGTH = 64;

  std::vector<uint8_t> index;
  std::vector<uint8_t> data;

  IndexationPayload() = default;
  IndexationPayload(std::vector<uint8_t> idx, std::vector<uint8_t> d) : index(std::move(idx)), data(std::move(d)) {}

  PayloadType type() const override { return PayloadType::Indexation; }
  void serialize_body(MessageSerializer& s) const override;
  bool deserialize_body(MessageDeserializer& d);
};

// Transaction building blocks

struct SignatureLockedSingleOutput {
  Address address;
  uint64_t amount{0};

  bool operator==(const SignatureLockedSingleOutput&) const = default;
  auto operator<=>(const SignatureLockedSingleOutput&) const = default;
};

struct Ed25519Signature {
  std::array<uint8_t, ED25519_PUBLIC_KEY_LENGTH> public_key{};
  std::array<uint8_t, ED25519_SIGNATURE_LENGTH> signature{};
};

struct UnlockBlock {
  enum class Kind : uint8_t {
    Signature = 0,
    Reference = 1,
  };

  Kind kind{Kind::Signature};
  Ed25519Signature signature;  // Kind::Signature
  uint16_t reference{0};       // Kind::Reference, index of an earlier signature block

  static UnlockBlock FromSignature(const Ed25519Signature& sig);
  static UnlockBlock FromReference(uint16_t index);
};

struct TransactionEssence {
  std::vector<OutputId> inputs;
  std::vector<SignatureLockedSingleOutput> outputs;
  std::shared_ptr<const IndexationPayload> payload;

  void serialize(MessageSerializer& s) const;
  bool deserialize(MessageDeserializer& d);

  // Bytes covered by the input signatures
  std::vector<uint8_t> signing_bytes() const;
};

class TransactionPayload : public Payload {
public:
  TransactionEssence essence;
  std::vector<UnlockBlock> unlock_blocks;

  PayloadType type() const override { return PayloadType::Transaction; }
  void serialize_body(MessageSerializer& s) const override;
  bool deserialize_body(MessageDeserializer& d);

  // Blake2b-256 of the serialized payload
  TransactionId id() const;
};

// MILESTONE - issued by the coordinator; kept as the node reported it so a
// fetched milestone message can be re-encoded without loss.
class MilestonePayload : public Payload {
public:
  std::string json;

  MilestonePayload() = default;
  explicit MilestonePayload(std::string j) : json(std::move(j)) {}

  PayloadType type() const override { return PayloadType::Milestone; }
  void serialize_body(MessageSerializer& s) const override;
  bool deserialize_body(MessageDeserializer& d);
};

}  // namespace message
}  // namespace tangle
