// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/http_node_api.hpp"

#include "api/json_codec.hpp"
#include "client/error.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"

namespace tangle {
namespace api {

using namespace message;

namespace {

constexpr int HTTP_OK = 200;
constexpr int HTTP_CREATED = 201;

// Error bodies can be large HTML pages; keep log lines and messages short
constexpr size_t MAX_ERROR_BODY = 256;

[[noreturn]] void ThrowStatus(const HttpResponse& r) {
  std::string body = r.body.substr(0, MAX_ERROR_BODY);
  throw Error(ErrorKind::ResponseError, std::to_string(r.status) + ": " + body);
}

}  // namespace

HttpNodeApi::HttpNodeApi(std::chrono::milliseconds request_timeout) : http_(request_timeout) {}

nlohmann::json HttpNodeApi::GetData(const util::NodeUrl& node, const std::string& path) {
  HttpResponse r = http_.Get(node, path);
  if (r.status != HTTP_OK) {
    LOG_NET_DEBUG("GET {}{} returned {}", node.str(), path, r.status);
    ThrowStatus(r);
  }
  return ParseData(r.body);
}

bool HttpNodeApi::GetHealth(const util::NodeUrl& node) {
  HttpResponse r = http_.Get(node, "/health");
  return r.status == HTTP_OK;
}

NodeInfo HttpNodeApi::GetInfo(const util::NodeUrl& node) {
  return NodeInfoFromJson(GetData(node, "/api/v1/info"));
}

Tips HttpNodeApi::GetTips(const util::NodeUrl& node) {
  return TipsFromJson(GetData(node, "/api/v1/tips"));
}

MessageId HttpNodeApi::PostMessage(const util::NodeUrl& node, const Message& msg) {
  HttpResponse r = http_.Post(node, "/api/v1/messages", MessageToJson(msg).dump());
  if (r.status != HTTP_CREATED && r.status != HTTP_OK) {
    LOG_NET_DEBUG("POST {}/api/v1/messages returned {}", node.str(), r.status);
    ThrowStatus(r);
  }
  return PostedMessageIdFromJson(ParseData(r.body));
}

Message HttpNodeApi::GetMessage(const util::NodeUrl& node, const MessageId& id) {
  return MessageFromJson(GetData(node, "/api/v1/messages/" + ToHex(id)));
}

MessageMetadata HttpNodeApi::GetMessageMetadata(const util::NodeUrl& node, const MessageId& id) {
  return MessageMetadataFromJson(GetData(node, "/api/v1/messages/" + ToHex(id) + "/metadata"));
}

std::vector<MessageId> HttpNodeApi::GetMessageIdsByIndex(const util::NodeUrl& node,
                                                         const std::vector<uint8_t>& index) {
  return MessageIdsFromJson(GetData(node, "/api/v1/messages?index=" + util::HexStr(index)));
}

uint64_t HttpNodeApi::GetAddressBalance(const util::NodeUrl& node, const Address& address) {
  return BalanceFromJson(GetData(node, "/api/v1/addresses/ed25519/" + address.ToHex()));
}

std::vector<OutputId> HttpNodeApi::GetAddressOutputs(const util::NodeUrl& node, const Address& address) {
  return OutputIdsFromJson(GetData(node, "/api/v1/addresses/ed25519/" + address.ToHex() + "/outputs"));
}

OutputMetadata HttpNodeApi::GetOutput(const util::NodeUrl& node, const OutputId& id) {
  return OutputMetadataFromJson(GetData(node, "/api/v1/outputs/" + id.ToHex()));
}

MilestoneMetadata HttpNodeApi::GetMilestone(const util::NodeUrl& node, uint32_t index) {
  return MilestoneFromJson(GetData(node, "/api/v1/milestones/" + std::to_string(index)));
}

}  // namespace api
}  // namespace tangle
