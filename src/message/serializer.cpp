// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "message/serializer.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace tangle {
namespace message {

void MessageSerializer::write_uint8(uint8_t value) {
  buffer_.push_back(value);
}

void MessageSerializer::write_uint16(uint16_t value) {
  buffer_.push_back(static_cast<uint8_t>(value));
  buffer_.push_back(static_cast<uint8_t>(value >> 8));
}

void MessageSerializer::write_uint32(uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
  }
}

void MessageSerializer::write_uint64(uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
  }
}

void MessageSerializer::write_bytes(const uint8_t* data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
}

void MessageSerializer::write_prefixed16(std::span<const uint8_t> data) {
  if (data.size() > std::numeric_limits<uint16_t>::max()) {
    throw std::length_error("MessageSerializer: field exceeds u16 length prefix");
  }
  write_uint16(static_cast<uint16_t>(data.size()));
  write_bytes(data);
}

void MessageSerializer::write_prefixed32(std::span<const uint8_t> data) {
  if (data.size() > std::numeric_limits<uint32_t>::max()) {
    throw std::length_error("MessageSerializer: field exceeds u32 length prefix");
  }
  write_uint32(static_cast<uint32_t>(data.size()));
  write_bytes(data);
}

MessageDeserializer::MessageDeserializer(const uint8_t* data, size_t size) : data_(data), size_(size) {}

MessageDeserializer::MessageDeserializer(std::span<const uint8_t> data)
    : data_(data.data()), size_(data.size()) {}

bool MessageDeserializer::check_available(size_t bytes) {
  if (error_ || bytes > size_ - position_) {
    error_ = true;
    return false;
  }
  return true;
}

uint8_t MessageDeserializer::read_uint8() {
  if (!check_available(1))
    return 0;
  return data_[position_++];
}

uint16_t MessageDeserializer::read_uint16() {
  if (!check_available(2))
    return 0;
  uint16_t v = static_cast<uint16_t>(data_[position_] | (data_[position_ + 1] << 8));
  position_ += 2;
  return v;
}

uint32_t MessageDeserializer::read_uint32() {
  if (!check_available(4))
    return 0;
  uint32_t v = 0;
  for (int i = 3; i >= 0; --i) {
    v = (v << 8) | data_[position_ + i];
  }
  position_ += 4;
  return v;
}

uint64_t MessageDeserializer::read_uint64() {
  if (!check_available(8))
    return 0;
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i) {
    v = (v << 8) | data_[position_ + i];
  }
  position_ += 8;
  return v;
}

std::vector<uint8_t> MessageDeserializer::read_bytes(size_t count) {
  if (!check_available(count))
    return {};
  std::vector<uint8_t> out(data_ + position_, data_ + position_ + count);
  position_ += count;
  return out;
}

std::vector<uint8_t> MessageDeserializer::read_prefixed16() {
  const uint16_t len = read_uint16();
  return read_bytes(len);
}

std::vector<uint8_t> MessageDeserializer::read_prefixed32() {
  const uint32_t len = read_uint32();
  return read_bytes(len);
}

}  // namespace message
}  // namespace tangle
