// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/json_codec.hpp"

#include "client/error.hpp"
#include "util/hex.hpp"

using json = nlohmann::json;

namespace tangle {
namespace api {

using namespace message;

namespace {

[[noreturn]] void Invalid(const std::string& what) {
  throw Error(ErrorKind::InvalidResponse, what);
}

template <size_t N>
std::array<uint8_t, N> FixedHex(const json& j, const char* field) {
  auto bytes = util::ParseHexFixed<N>(j.at(field).get<std::string>());
  if (!bytes) {
    Invalid(std::string("field '") + field + "' is not " + std::to_string(N) + " bytes of hex");
  }
  return *bytes;
}

std::vector<uint8_t> VarHex(const json& j, const char* field) {
  auto bytes = util::ParseHex(j.at(field).get<std::string>());
  if (!bytes) {
    Invalid(std::string("field '") + field + "' is not hex");
  }
  return *bytes;
}

// u64 fields arrive as decimal strings (or plain numbers from older nodes)
uint64_t U64Field(const json& j, const char* field) {
  const json& v = j.at(field);
  if (v.is_number_unsigned()) {
    return v.get<uint64_t>();
  }
  const std::string s = v.get<std::string>();
  if (s.empty() || s.size() > 20 || s.find_first_not_of("0123456789") != std::string::npos) {
    Invalid(std::string("field '") + field + "' is not an unsigned integer");
  }
  try {
    return std::stoull(s);
  } catch (const std::out_of_range&) {
    Invalid(std::string("field '") + field + "' overflows 64 bits");
  }
}

json AddressToJson(const Address& a) {
  return json{{"type", static_cast<int>(a.type)}, {"address", a.ToHex()}};
}

Address AddressFromJson(const json& j) {
  if (j.at("type").get<int>() != static_cast<int>(AddressType::Ed25519)) {
    throw Error(ErrorKind::InvalidParameter, "address type");
  }
  Address a;
  a.bytes = FixedHex<ADDRESS_LENGTH>(j, "address");
  return a;
}

json EssenceToJson(const TransactionEssence& essence) {
  json inputs = json::array();
  for (const auto& in : essence.inputs) {
    inputs.push_back({{"type", 0},
                      {"transactionId", util::HexStr(in.transaction_id)},
                      {"transactionOutputIndex", in.index}});
  }
  json outputs = json::array();
  for (const auto& out : essence.outputs) {
    outputs.push_back({{"type", 0}, {"address", AddressToJson(out.address)}, {"amount", out.amount}});
  }
  json j{{"type", 0}, {"inputs", inputs}, {"outputs", outputs}};
  j["payload"] = essence.payload ? PayloadToJson(*essence.payload) : json(nullptr);
  return j;
}

TransactionEssence EssenceFromJson(const json& j) {
  if (j.at("type").get<int>() != 0) {
    Invalid("unknown transaction essence type");
  }
  TransactionEssence essence;
  for (const auto& in : j.at("inputs")) {
    if (in.at("type").get<int>() != 0) {
      Invalid("unknown input type");
    }
    OutputId id;
    id.transaction_id = FixedHex<TRANSACTION_ID_LENGTH>(in, "transactionId");
    id.index = in.at("transactionOutputIndex").get<uint16_t>();
    essence.inputs.push_back(id);
  }
  for (const auto& out : j.at("outputs")) {
    if (out.at("type").get<int>() != 0) {
      Invalid("unknown output type");
    }
    SignatureLockedSingleOutput o;
    o.address = AddressFromJson(out.at("address"));
    o.amount = out.at("amount").get<uint64_t>();
    essence.outputs.push_back(o);
  }
  if (j.contains("payload") && !j["payload"].is_null()) {
    auto embedded = std::dynamic_pointer_cast<const IndexationPayload>(PayloadFromJson(j["payload"]));
    if (!embedded) {
      Invalid("transaction essence may only embed an indexation payload");
    }
    essence.payload = embedded;
  }
  return essence;
}

json UnlockBlockToJson(const UnlockBlock& block) {
  if (block.kind == UnlockBlock::Kind::Reference) {
    return json{{"type", 1}, {"reference", block.reference}};
  }
  return json{{"type", 0},
              {"signature",
               {{"type", 1},
                {"publicKey", util::HexStr(block.signature.public_key)},
                {"signature", util::HexStr(block.signature.signature)}}}};
}

UnlockBlock UnlockBlockFromJson(const json& j) {
  const int type = j.at("type").get<int>();
  if (type == 1) {
    return UnlockBlock::FromReference(j.at("reference").get<uint16_t>());
  }
  if (type != 0) {
    Invalid("unknown unlock block type");
  }
  const json& sig = j.at("signature");
  if (sig.at("type").get<int>() != 1) {
    Invalid("unknown signature type");
  }
  Ed25519Signature s;
  s.public_key = FixedHex<ED25519_PUBLIC_KEY_LENGTH>(sig, "publicKey");
  s.signature = FixedHex<ED25519_SIGNATURE_LENGTH>(sig, "signature");
  return UnlockBlock::FromSignature(s);
}

// Runs a decoder and maps nlohmann exceptions onto InvalidResponse
template <typename F>
auto Decode(const char* what, F&& f) -> decltype(f()) {
  try {
    return f();
  } catch (const json::exception& e) {
    Invalid(std::string(what) + ": " + e.what());
  }
}

}  // namespace

json ParseData(const std::string& body) {
  json j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    Invalid("response body is not a JSON object");
  }
  if (!j.contains("data") || !j["data"].is_object()) {
    Invalid("response has no 'data' object");
  }
  return j["data"];
}

json PayloadToJson(const Payload& payload) {
  switch (payload.type()) {
  case PayloadType::Indexation: {
    const auto& p = dynamic_cast<const IndexationPayload&>(payload);
    return json{{"type", 2}, {"index", util::HexStr(p.index)}, {"data", util::HexStr(p.data)}};
  }
  case PayloadType::Transaction: {
    const auto& p = dynamic_cast<const TransactionPayload&>(payload);
    json blocks = json::array();
    for (const auto& b : p.unlock_blocks) {
      blocks.push_back(UnlockBlockToJson(b));
    }
    return json{{"type", 0}, {"essence", EssenceToJson(p.essence)}, {"unlockBlocks", blocks}};
  }
  case PayloadType::Milestone: {
    const auto& p = dynamic_cast<const MilestonePayload&>(payload);
    json j = json::parse(p.json, nullptr, false);
    if (j.is_discarded()) {
      throw Error(ErrorKind::TransactionError, "milestone payload holds invalid JSON");
    }
    return j;
  }
  }
  throw Error(ErrorKind::TransactionError, "unknown payload type");
}

PayloadPtr PayloadFromJson(const json& j) {
  return Decode("payload", [&]() -> PayloadPtr {
    const int type = j.at("type").get<int>();
    switch (type) {
    case 2: {
      auto p = std::make_shared<IndexationPayload>();
      p->index = VarHex(j, "index");
      p->data = VarHex(j, "data");
      return p;
    }
    case 0: {
      auto p = std::make_shared<TransactionPayload>();
      p->essence = EssenceFromJson(j.at("essence"));
      for (const auto& b : j.at("unlockBlocks")) {
        p->unlock_blocks.push_back(UnlockBlockFromJson(b));
      }
      return p;
    }
    case 1:
      return std::make_shared<MilestonePayload>(j.dump());
    default:
      Invalid("unknown payload type " + std::to_string(type));
    }
  });
}

json MessageToJson(const Message& msg) {
  json j{{"networkId", std::to_string(msg.network_id)},
         {"parent1MessageId", ToHex(msg.parent1)},
         {"parent2MessageId", ToHex(msg.parent2)},
         {"nonce", std::to_string(msg.nonce)}};
  j["payload"] = msg.payload ? PayloadToJson(*msg.payload) : json(nullptr);
  return j;
}

Message MessageFromJson(const json& j) {
  return Decode("message", [&]() {
    Message m;
    m.network_id = U64Field(j, "networkId");
    m.parent1 = FixedHex<MESSAGE_ID_LENGTH>(j, "parent1MessageId");
    m.parent2 = FixedHex<MESSAGE_ID_LENGTH>(j, "parent2MessageId");
    if (j.contains("payload") && !j["payload"].is_null()) {
      m.payload = PayloadFromJson(j["payload"]);
    }
    m.nonce = U64Field(j, "nonce");
    return m;
  });
}

NodeInfo NodeInfoFromJson(const json& data) {
  return Decode("node info", [&]() {
    NodeInfo info;
    info.name = data.at("name").get<std::string>();
    info.version = data.at("version").get<std::string>();
    info.is_healthy = data.at("isHealthy").get<bool>();
    info.network_id = data.at("networkId").get<std::string>();
    info.min_pow_score = data.at("minPowScore").get<double>();
    info.latest_milestone_index = data.value("latestMilestoneIndex", uint32_t{0});
    info.solid_milestone_index = data.value("solidMilestoneIndex", uint32_t{0});
    info.pruning_index = data.value("pruningIndex", uint32_t{0});
    if (data.contains("features")) {
      info.features = data["features"].get<std::vector<std::string>>();
    }
    return info;
  });
}

Tips TipsFromJson(const json& data) {
  return Decode("tips", [&]() {
    Tips tips;
    tips.tip1 = FixedHex<MESSAGE_ID_LENGTH>(data, "tip1MessageId");
    tips.tip2 = FixedHex<MESSAGE_ID_LENGTH>(data, "tip2MessageId");
    return tips;
  });
}

MessageMetadata MessageMetadataFromJson(const json& data) {
  return Decode("message metadata", [&]() {
    MessageMetadata meta;
    meta.message_id = FixedHex<MESSAGE_ID_LENGTH>(data, "messageId");
    for (const char* field : {"parent1MessageId", "parent2MessageId"}) {
      if (data.contains(field)) {
        meta.parents.push_back(FixedHex<MESSAGE_ID_LENGTH>(data, field));
      }
    }
    meta.is_solid = data.value("isSolid", false);
    if (data.contains("referencedByMilestoneIndex") && !data["referencedByMilestoneIndex"].is_null()) {
      meta.referenced_by_milestone_index = data["referencedByMilestoneIndex"].get<uint32_t>();
    }
    if (data.contains("ledgerInclusionState") && !data["ledgerInclusionState"].is_null()) {
      meta.ledger_inclusion_state = data["ledgerInclusionState"].get<std::string>();
    }
    if (data.contains("shouldPromote") && !data["shouldPromote"].is_null()) {
      meta.should_promote = data["shouldPromote"].get<bool>();
    }
    if (data.contains("shouldReattach") && !data["shouldReattach"].is_null()) {
      meta.should_reattach = data["shouldReattach"].get<bool>();
    }
    return meta;
  });
}

std::vector<MessageId> MessageIdsFromJson(const json& data) {
  return Decode("message ids", [&]() {
    std::vector<MessageId> ids;
    for (const auto& s : data.at("messageIds")) {
      auto id = util::ParseHexFixed<MESSAGE_ID_LENGTH>(s.get<std::string>());
      if (!id) {
        Invalid("message id is not 32 bytes of hex");
      }
      ids.push_back(*id);
    }
    return ids;
  });
}

uint64_t BalanceFromJson(const json& data) {
  return Decode("balance", [&]() { return data.at("balance").get<uint64_t>(); });
}

std::vector<OutputId> OutputIdsFromJson(const json& data) {
  return Decode("output ids", [&]() {
    std::vector<OutputId> ids;
    for (const auto& s : data.at("outputIds")) {
      const std::string hex = s.get<std::string>();
      if (!util::ParseHexFixed<TRANSACTION_ID_LENGTH + 2>(hex)) {
        Invalid("output id is not 34 bytes of hex");
      }
      ids.push_back(OutputId::FromHex(hex));
    }
    return ids;
  });
}

OutputMetadata OutputMetadataFromJson(const json& data) {
  return Decode("output", [&]() {
    OutputMetadata out;
    out.message_id = FixedHex<MESSAGE_ID_LENGTH>(data, "messageId");
    out.transaction_id = FixedHex<TRANSACTION_ID_LENGTH>(data, "transactionId");
    out.output_index = data.at("outputIndex").get<uint16_t>();
    out.is_spent = data.at("isSpent").get<bool>();
    const json& output = data.at("output");
    out.amount = output.at("amount").get<uint64_t>();
    out.address = AddressFromJson(output.at("address"));
    return out;
  });
}

MilestoneMetadata MilestoneFromJson(const json& data) {
  return Decode("milestone", [&]() {
    MilestoneMetadata ms;
    ms.index = data.at("milestoneIndex").get<uint32_t>();
    ms.message_id = FixedHex<MESSAGE_ID_LENGTH>(data, "messageId");
    ms.timestamp = data.at("timestamp").get<uint64_t>();
    return ms;
  });
}

MessageId PostedMessageIdFromJson(const json& data) {
  return Decode("posted message", [&]() { return FixedHex<MESSAGE_ID_LENGTH>(data, "messageId"); });
}

}  // namespace api
}  // namespace tangle
