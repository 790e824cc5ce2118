// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "message/payload.hpp"

#include "util/blake2b.hpp"

namespace tangle {
namespace message {

namespace {

constexpr uint8_t INPUT_TYPE_UTXO = 0;
constexpr uint8_t OUTPUT_TYPE_SIGNATURE_LOCKED_SINGLE = 0;
constexpr uint8_t ESSENCE_TYPE_REGULAR = 0;
constexpr uint8_t SIGNATURE_TYPE_ED25519 = 1;

// Bounds from the node's transaction rules
constexpr uint16_t MAX_INPUTS = 127;
constexpr uint16_t MAX_OUTPUTS = 127;

void WriteAddress(MessageSerializer& s, const Address& a) {
  s.write_uint8(static_cast<uint8_t>(a.type));
  s.write_bytes(a.bytes);
}

bool ReadAddress(MessageDeserializer& d, Address& a) {
  const uint8_t type = d.read_uint8();
  if (type != static_cast<uint8_t>(AddressType::Ed25519)) {
    d.set_error();
    return false;
  }
  a.type = AddressType::Ed25519;
  a.bytes = d.read_array<ADDRESS_LENGTH>();
  return !d.has_error();
}

}  // namespace

std::vector<uint8_t> Payload::serialize() const {
  MessageSerializer s;
  s.write_uint32(static_cast<uint32_t>(type()));
  serialize_body(s);
  return s.release();
}

PayloadPtr DeserializePayload(std::span<const uint8_t> data) {
  MessageDeserializer d(data);
  const uint32_t type = d.read_uint32();
  if (d.has_error()) {
    return nullptr;
  }

  PayloadPtr result;
  bool ok = false;
  switch (static_cast<PayloadType>(type)) {
  case PayloadType::Indexation: {
    auto p = std::make_shared<IndexationPayload>();
    ok = p->deserialize_body(d);
    result = p;
    break;
  }
  case PayloadType::Transaction: {
    auto p = std::make_shared<TransactionPayload>();
    ok = p->deserialize_body(d);
    result = p;
    break;
  }
  case PayloadType::Milestone: {
    auto p = std::make_shared<MilestonePayload>();
    ok = p->deserialize_body(d);
    result = p;
    break;
  }
  default:
    return nullptr;
  }

  if (!ok || d.has_error() || d.bytes_remaining() != 0) {
    return nullptr;
  }
  return result;
}

// ---------------------------------------------------------------------------
// Indexation
// ---------------------------------------------------------------------------

void IndexationPayload::serialize_body(MessageSerializer& s) const {
  s.write_prefixed16(index);
  s.write_prefixed32(data);
}

bool IndexationPayload::deserialize_body(MessageDeserializer& d) {
  index = d.read_prefixed16();
  data = d.read_prefixed32();
  if (index.empty() || index.size() > MAX_INDEX_LENGTH) {
    d.set_error();
  }
  return !d.has_error();
}

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

UnlockBlock UnlockBlock::FromSignature(const Ed25519Signature& sig) {
  UnlockBlock b;
  b.kind = Kind::Signature;
  b.signature = sig;
  return b;
}

UnlockBlock UnlockBlock::FromReference(uint16_t index) {
  UnlockBlock b;
  b.kind = Kind::Reference;
  b.reference = index;
  return b;
}

void TransactionEssence::serialize(MessageSerializer& s) const {
  s.write_uint8(ESSENCE_TYPE_REGULAR);

  s.write_uint16(static_cast<uint16_t>(inputs.size()));
  for (const auto& input : inputs) {
    s.write_uint8(INPUT_TYPE_UTXO);
    s.write_bytes(input.transaction_id);
    s.write_uint16(input.index);
  }

  s.write_uint16(static_cast<uint16_t>(outputs.size()));
  for (const auto& output : outputs) {
    s.write_uint8(OUTPUT_TYPE_SIGNATURE_LOCKED_SINGLE);
    WriteAddress(s, output.address);
    s.write_uint64(output.amount);
  }

  if (payload) {
    s.write_prefixed32(payload->serialize());
  } else {
    s.write_uint32(0);
  }
}

bool TransactionEssence::deserialize(MessageDeserializer& d) {
  if (d.read_uint8() != ESSENCE_TYPE_REGULAR) {
    d.set_error();
    return false;
  }

  const uint16_t input_count = d.read_uint16();
  if (input_count == 0 || input_count > MAX_INPUTS) {
    d.set_error();
    return false;
  }
  inputs.clear();
  for (uint16_t i = 0; i < input_count && !d.has_error(); ++i) {
    if (d.read_uint8() != INPUT_TYPE_UTXO) {
      d.set_error();
      return false;
    }
    OutputId input;
    input.transaction_id = d.read_array<TRANSACTION_ID_LENGTH>();
    input.index = d.read_uint16();
    inputs.push_back(input);
  }

  const uint16_t output_count = d.read_uint16();
  if (output_count == 0 || output_count > MAX_OUTPUTS) {
    d.set_error();
    return false;
  }
  outputs.clear();
  for (uint16_t i = 0; i < output_count && !d.has_error(); ++i) {
    if (d.read_uint8() != OUTPUT_TYPE_SIGNATURE_LOCKED_SINGLE) {
      d.set_error();
      return false;
    }
    SignatureLockedSingleOutput output;
    if (!ReadAddress(d, output.address)) {
      return false;
    }
    output.amount = d.read_uint64();
    outputs.push_back(output);
  }

  auto embedded = d.read_prefixed32();
  payload.reset();
  if (!embedded.empty()) {
    auto decoded = std::dynamic_pointer_cast<const IndexationPayload>(DeserializePayload(embedded));
    if (!decoded) {
      // Only indexation payloads may ride inside a transaction
      d.set_error();
      return false;
    }
    payload = decoded;
  }
  return !d.has_error();
}

std::vector<uint8_t> TransactionEssence::signing_bytes() const {
  MessageSerializer s;
  serialize(s);
  return s.release();
}

void TransactionPayload::serialize_body(MessageSerializer& s) const {
  essence.serialize(s);
  s.write_uint16(static_cast<uint16_t>(unlock_blocks.size()));
  for (const auto& block : unlock_blocks) {
    s.write_uint8(static_cast<uint8_t>(block.kind));
    if (block.kind == UnlockBlock::Kind::Signature) {
      s.write_uint8(SIGNATURE_TYPE_ED25519);
      s.write_bytes(block.signature.public_key);
      s.write_bytes(block.signature.signature);
    } else {
      s.write_uint16(block.reference);
    }
  }
}

bool TransactionPayload::deserialize_body(MessageDeserializer& d) {
  if (!essence.deserialize(d)) {
    return false;
  }
  const uint16_t count = d.read_uint16();
  unlock_blocks.clear();
  for (uint16_t i = 0; i < count && !d.has_error(); ++i) {
    const uint8_t kind = d.read_uint8();
    if (kind == static_cast<uint8_t>(UnlockBlock::Kind::Signature)) {
      if (d.read_uint8() != SIGNATURE_TYPE_ED25519) {
        d.set_error();
        return false;
      }
      Ed25519Signature sig;
      sig.public_key = d.read_array<ED25519_PUBLIC_KEY_LENGTH>();
      sig.signature = d.read_array<ED25519_SIGNATURE_LENGTH>();
      unlock_blocks.push_back(UnlockBlock::FromSignature(sig));
    } else if (kind == static_cast<uint8_t>(UnlockBlock::Kind::Reference)) {
      const uint16_t ref = d.read_uint16();
      if (ref >= i) {
        // A reference must point at an earlier signature block
        d.set_error();
        return false;
      }
      unlock_blocks.push_back(UnlockBlock::FromReference(ref));
    } else {
      d.set_error();
      return false;
    }
  }
  if (unlock_blocks.size() != essence.inputs.size()) {
    d.set_error();
  }
  return !d.has_error();
}

TransactionId TransactionPayload::id() const {
  return util::Blake2b256(serialize());
}

// ---------------------------------------------------------------------------
// Milestone
// ---------------------------------------------------------------------------

void MilestonePayload::serialize_body(MessageSerializer& s) const {
  s.write_prefixed32(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(json.data()), json.size()));
}

bool MilestonePayload::deserialize_body(MessageDeserializer& d) {
  auto bytes = d.read_prefixed32();
  json.assign(bytes.begin(), bytes.end());
  return !d.has_error();
}

}  // namespace message
}  // namespace tangle
