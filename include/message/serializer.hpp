// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace tangle {
namespace message {

// Little-endian byte writer for the message encoding
class MessageSerializer {
public:
  MessageSerializer() = default;

  void write_uint8(uint8_t value);
  void write_uint16(uint16_t value);
  void write_uint32(uint32_t value);
  void write_uint64(uint64_t value);

  void write_bytes(const uint8_t* data, size_t len);
  void write_bytes(std::span<const uint8_t> data) { write_bytes(data.data(), data.size()); }

  // u16 length prefix followed by the bytes
  void write_prefixed16(std::span<const uint8_t> data);
  // u32 length prefix followed by the bytes
  void write_prefixed32(std::span<const uint8_t> data);

  const std::vector<uint8_t>& data() const { return buffer_; }
  std::vector<uint8_t> release() { return std::move(buffer_); }
  size_t size() const { return buffer_.size(); }

  void clear() { buffer_.clear(); }

private:
  std::vector<uint8_t> buffer_;
};

// Reader counterpart. Reading past the end sets the error flag and yields
// zeros; callers check has_error() once after decoding.
class MessageDeserializer {
public:
  MessageDeserializer(const uint8_t* data, size_t size);
  explicit MessageDeserializer(std::span<const uint8_t> data);

  uint8_t read_uint8();
  uint16_t read_uint16();
  uint32_t read_uint32();
  uint64_t read_uint64();

  std::vector<uint8_t> read_bytes(size_t count);

  template <size_t N>
  std::array<uint8_t, N> read_array() {
    std::array<uint8_t, N> out{};
    if (check_available(N)) {
      std::copy(data_ + position_, data_ + position_ + N, out.begin());
      position_ += N;
    }
    return out;
  }

  std::vector<uint8_t> read_prefixed16();
  std::vector<uint8_t> read_prefixed32();

  size_t bytes_remaining() const { return size_ - position_; }
  size_t position() const { return position_; }
  bool has_error() const { return error_; }

  // Marks the input as malformed (unknown type tags and the like)
  void set_error() { error_ = true; }

private:
  const uint8_t* data_;
  size_t size_;
  size_t position_{0};
  bool error_{false};

  bool check_available(size_t bytes);
};

}  // namespace message
}  // namespace tangle
