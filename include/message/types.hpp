// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tangle {
namespace message {

constexpr size_t MESSAGE_ID_LENGTH = 32;
constexpr size_t TRANSACTION_ID_LENGTH = 32;
constexpr size_t ADDRESS_LENGTH = 32;
constexpr size_t ED25519_PUBLIC_KEY_LENGTH = 32;
constexpr size_t ED25519_SIGNATURE_LENGTH = 64;

// Largest serialized message a node accepts
constexpr size_t MAX_MESSAGE_LENGTH = 32768;

using MessageId = std::array<uint8_t, MESSAGE_ID_LENGTH>;
using TransactionId = std::array<uint8_t, TRANSACTION_ID_LENGTH>;

std::string ToHex(const MessageId& id);
// Throws Error(InvalidParameter) unless hex is exactly 32 bytes
MessageId MessageIdFromHex(const std::string& hex);

enum class AddressType : uint8_t {
  Ed25519 = 1,
};

// 32-byte address plus its type tag
struct Address {
  AddressType type{AddressType::Ed25519};
  std::array<uint8_t, ADDRESS_LENGTH> bytes{};

  std::string ToHex() const;
  static Address FromHex(const std::string& hex);  // Ed25519, throws InvalidParameter

  bool operator==(const Address&) const = default;
  auto operator<=>(const Address&) const = default;
};

// Transaction output reference: transaction id + output index
struct OutputId {
  TransactionId transaction_id{};
  uint16_t index{0};

  // 34 bytes as hex: txid followed by little-endian index
  std::string ToHex() const;
  static OutputId FromHex(const std::string& hex);

  bool operator==(const OutputId&) const = default;
  auto operator<=>(const OutputId&) const = default;
};

struct Tips {
  MessageId tip1{};
  MessageId tip2{};
};

struct MessageMetadata {
  MessageId message_id{};
  std::vector<MessageId> parents;
  bool is_solid{false};
  std::optional<uint32_t> referenced_by_milestone_index;
  std::optional<std::string> ledger_inclusion_state;
  // Absent flags mean the node sees no need
  std::optional<bool> should_promote;
  std::optional<bool> should_reattach;
};

struct NodeInfo {
  std::string name;
  std::string version;
  bool is_healthy{false};
  std::string network_id;
  double min_pow_score{0.0};
  uint32_t latest_milestone_index{0};
  uint32_t solid_milestone_index{0};
  uint32_t pruning_index{0};
  std::vector<std::string> features;
};

struct OutputMetadata {
  MessageId message_id{};
  TransactionId transaction_id{};
  uint16_t output_index{0};
  bool is_spent{false};
  uint64_t amount{0};
  Address address;
};

struct MilestoneMetadata {
  uint32_t index{0};
  MessageId message_id{};
  uint64_t timestamp{0};
};

struct AddressBalance {
  Address address;
  uint64_t balance{0};
};

struct UnspentAddress {
  Address address;
  uint64_t index{0};
};

}  // namespace message
}  // namespace tangle
