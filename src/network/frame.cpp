// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/frame.hpp"

#include <stdexcept>

namespace peerlink {
namespace frame {

bool IsWellFormedUtf8(std::string_view data) noexcept {
  const auto* p = reinterpret_cast<const unsigned char*>(data.data());
  const size_t n = data.size();
  size_t i = 0;

  while (i < n) {
    unsigned char c = p[i];
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t len;
    uint32_t cp;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;  // stray continuation byte or 0xF8..0xFF
    }

    if (i + len > n) {
      return false;  // truncated sequence
    }
    for (size_t k = 1; k < len; ++k) {
      unsigned char cc = p[i + k];
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }

    // Overlong encodings
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
      return false;
    }
    // UTF-16 surrogates and out of range
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
      return false;
    }
    i += len;
  }
  return true;
}

std::vector<uint8_t> EncodeFrame(const std::string& payload) {
  if (payload.size() > protocol::MAX_PAYLOAD_SIZE) {
    throw std::invalid_argument("payload of " + std::to_string(payload.size()) + " bytes exceeds frame limit of " +
                                std::to_string(protocol::MAX_PAYLOAD_SIZE) + " bytes");
  }
  if (!IsWellFormedUtf8(payload)) {
    throw std::invalid_argument("payload is not well-formed UTF-8");
  }

  std::vector<uint8_t> out;
  out.reserve(protocol::FRAME_HEADER_SIZE + payload.size());
  out.push_back(static_cast<uint8_t>((payload.size() >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(payload.size() & 0xFF));
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

void FrameDecoder::feed(const uint8_t* data, size_t len) {
  if (failed_ || len == 0) {
    return;
  }
  compact();
  buffer_.insert(buffer_.end(), data, data + len);
}

std::optional<std::string> FrameDecoder::next() {
  if (failed_) {
    return std::nullopt;
  }

  size_t available = buffer_.size() - offset_;
  if (available < protocol::FRAME_HEADER_SIZE) {
    return std::nullopt;
  }

  const uint8_t* read_ptr = buffer_.data() + offset_;
  size_t length = (static_cast<size_t>(read_ptr[0]) << 8) | static_cast<size_t>(read_ptr[1]);
  if (available < protocol::FRAME_HEADER_SIZE + length) {
    // Wait for the rest of the payload
    return std::nullopt;
  }

  const char* payload_ptr = reinterpret_cast<const char*>(read_ptr + protocol::FRAME_HEADER_SIZE);
  std::string payload(payload_ptr, length);
  if (!IsWellFormedUtf8(payload)) {
    failed_ = true;
    error_ = "malformed UTF-8 in " + std::to_string(length) + "-byte frame";
    return std::nullopt;
  }

  offset_ += protocol::FRAME_HEADER_SIZE + length;
  return payload;
}

void FrameDecoder::compact() {
  // Drop consumed bytes once they make up at least half the buffer
  if (offset_ > 0 && offset_ >= buffer_.size() / 2) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    offset_ = 0;
    if (buffer_.size() < 1024) {
      buffer_.shrink_to_fit();
    }
  }
}

}  // namespace frame
}  // namespace peerlink
