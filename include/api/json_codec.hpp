// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "message/message.hpp"
#include "message/types.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tangle {
namespace api {

/*
 JSON codec for the node REST API

 Every decoder throws Error(InvalidResponse) when a field is missing or has
 the wrong type, so a misbehaving node never surfaces as a raw
 nlohmann::json exception. Byte strings travel as lowercase hex; 64-bit
 counters (network id, nonce) travel as decimal strings.
*/

// Parse a response body and return its "data" member
nlohmann::json ParseData(const std::string& body);

nlohmann::json MessageToJson(const message::Message& msg);
message::Message MessageFromJson(const nlohmann::json& j);

nlohmann::json PayloadToJson(const message::Payload& payload);
message::PayloadPtr PayloadFromJson(const nlohmann::json& j);

message::NodeInfo NodeInfoFromJson(const nlohmann::json& data);
message::Tips TipsFromJson(const nlohmann::json& data);
message::MessageMetadata MessageMetadataFromJson(const nlohmann::json& data);
std::vector<message::MessageId> MessageIdsFromJson(const nlohmann::json& data);
uint64_t BalanceFromJson(const nlohmann::json& data);
std::vector<message::OutputId> OutputIdsFromJson(const nlohmann::json& data);
// Throws Error(InvalidParameter, "address type") for a non-Ed25519 address
message::OutputMetadata OutputMetadataFromJson(const nlohmann::json& data);
message::MilestoneMetadata MilestoneFromJson(const nlohmann::json& data);
message::MessageId PostedMessageIdFromJson(const nlohmann::json& data);

}  // namespace api
}  // namespace tangle
