// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "message/types.hpp"

#include "client/error.hpp"
#include "util/hex.hpp"

#include <algorithm>

namespace tangle {
namespace message {

std::string ToHex(const MessageId& id) {
  return util::HexStr(id);
}

MessageId MessageIdFromHex(const std::string& hex) {
  auto bytes = util::ParseHexFixed<MESSAGE_ID_LENGTH>(hex);
  if (!bytes) {
    throw Error(ErrorKind::InvalidParameter, "message id: expected 64 hex characters, got '" + hex + "'");
  }
  return *bytes;
}

std::string Address::ToHex() const {
  return util::HexStr(bytes);
}

Address Address::FromHex(const std::string& hex) {
  auto bytes = util::ParseHexFixed<ADDRESS_LENGTH>(hex);
  if (!bytes) {
    throw Error(ErrorKind::InvalidParameter, "address: expected 64 hex characters, got '" + hex + "'");
  }
  Address out;
  out.bytes = *bytes;
  return out;
}

std::string OutputId::ToHex() const {
  std::array<uint8_t, TRANSACTION_ID_LENGTH + 2> raw{};
  std::copy(transaction_id.begin(), transaction_id.end(), raw.begin());
  raw[TRANSACTION_ID_LENGTH] = static_cast<uint8_t>(index & 0xff);
  raw[TRANSACTION_ID_LENGTH + 1] = static_cast<uint8_t>(index >> 8);
  return util::HexStr(raw);
}

OutputId OutputId::FromHex(const std::string& hex) {
  auto raw = util::ParseHexFixed<TRANSACTION_ID_LENGTH + 2>(hex);
  if (!raw) {
    throw Error(ErrorKind::InvalidParameter, "output id: expected 68 hex characters, got '" + hex + "'");
  }
  OutputId out;
  std::copy(raw->begin(), raw->begin() + TRANSACTION_ID_LENGTH, out.transaction_id.begin());
  out.index = static_cast<uint16_t>((*raw)[TRANSACTION_ID_LENGTH] | ((*raw)[TRANSACTION_ID_LENGTH + 1] << 8));
  return out;
}

}  // namespace message
}  // namespace tangle
