// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace peerlink {
namespace network {

class Connection;
using ConnectionPtr = std::shared_ptr<Connection>;

// Raw bytes as they arrive from the socket (not frame aligned)
using ReceiveCallback = std::function<void(const std::vector<uint8_t>&)>;

// Remote side closed the stream or a read failed. Not invoked when the
// connection is closed locally with close().
using DisconnectCallback = std::function<void()>;

// Connection - one open bidirectional byte stream bound to a PeerAddress
//
// Reads are asynchronous and delivered through the receive callback, one
// callback at a time in stream order. Writes are serialized per connection,
// so whole frames from concurrent senders never interleave.
class Connection {
public:
  virtual ~Connection() = default;

  // Begin asynchronous reading. Callbacks must be set before start().
  virtual void start() = 0;

  // Write all bytes. Blocks until written.
  // Throws std::system_error if the connection is closed or the write fails.
  // From an I/O thread (inside a callback) the bytes are queued instead and a
  // failed write surfaces through the disconnect callback.
  virtual void send(const std::vector<uint8_t>& data) = 0;

  // Close the socket. Returns false if it was already closed (by this or
  // another caller, or by the remote side). Throws std::system_error if the
  // underlying close fails.
  virtual bool close() = 0;

  // Issue no further reads and drop both callbacks. The socket stays open
  // and writable; bytes or a close from the remote side go unnoticed.
  virtual void stop_reading() = 0;

  virtual bool is_open() const = 0;
  virtual const protocol::PeerAddress& peer_address() const = 0;
  virtual bool is_inbound() const = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

}  // namespace network
}  // namespace peerlink
