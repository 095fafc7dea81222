// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace peerlink {
namespace frame {

// True if data is well-formed UTF-8 (no overlong forms, no surrogates,
// nothing above U+10FFFF)
bool IsWellFormedUtf8(std::string_view data) noexcept;

// Encode one frame: 2-byte big-endian length followed by the payload bytes.
// Throws std::invalid_argument if the payload is longer than
// protocol::MAX_PAYLOAD_SIZE bytes or is not well-formed UTF-8.
std::vector<uint8_t> EncodeFrame(const std::string& payload);

// FrameDecoder - incremental decoder for one byte stream
//
// Bytes are appended with feed() as they arrive; next() pops complete frames
// in stream order. A malformed payload puts the decoder into a failed state
// from which it never recovers (the stream can no longer be trusted).
//
// Not thread-safe: each connection owns one decoder, driven from that
// connection's strand.
class FrameDecoder {
public:
  FrameDecoder() = default;

  void feed(const uint8_t* data, size_t len);
  void feed(const std::vector<uint8_t>& data) { feed(data.data(), data.size()); }

  // Next complete payload, or nullopt if more bytes are needed or the
  // decoder has failed.
  std::optional<std::string> next();

  bool failed() const { return failed_; }
  const std::string& error() const { return error_; }

  // Bytes received but not yet consumed
  size_t buffered() const { return buffer_.size() - offset_; }

private:
  void compact();

  // Read offset pattern: consumed bytes stay in buffer_ until compact()
  std::vector<uint8_t> buffer_;
  size_t offset_ = 0;
  bool failed_ = false;
  std::string error_;
};

}  // namespace frame
}  // namespace peerlink
