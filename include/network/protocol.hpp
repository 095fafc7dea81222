// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace peerlink {
namespace protocol {

// Frame layout: 2-byte unsigned big-endian payload length, then the payload
constexpr size_t FRAME_HEADER_SIZE = 2;

// Largest payload representable in the length field. Payloads above this are
// rejected by the encoder, never truncated.
constexpr size_t MAX_PAYLOAD_SIZE = 0xFFFF;

constexpr size_t MAX_FRAME_SIZE = FRAME_HEADER_SIZE + MAX_PAYLOAD_SIZE;

// Per-read receive buffer size
constexpr size_t RECV_BUFFER_SIZE = 16 * 1024;

// Reserved payload values. These travel as ordinary frames; only the reader
// (CLOSE) and the controller (CONFIRM) give them meaning.
namespace tags {
// Sent by the accepting side to acknowledge an inbound connection
constexpr const char* CONFIRM = "[CONFIRM]";
// Ends the receiving reader's decode loop
constexpr const char* CLOSE = "CLOSE";
}  // namespace tags

// PeerAddress - remote endpoint of a connection, used as the registry key.
// host is a numeric IP in canonical form (IPv4-mapped IPv6 is stored as IPv4).
struct PeerAddress {
  std::string host;
  uint16_t port{0};

  PeerAddress() = default;
  PeerAddress(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

  // "host:port", or "[host]:port" for IPv6
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] bool empty() const noexcept { return host.empty() && port == 0; }

  auto operator<=>(const PeerAddress& other) const = default;
  bool operator==(const PeerAddress& other) const = default;
};

struct PeerAddressHash {
  size_t operator()(const PeerAddress& addr) const noexcept;
};

}  // namespace protocol
}  // namespace peerlink
