// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"

#include <string>

namespace peerlink {
namespace network {

/**
 * PeerController - application layer notified of peer events
 *
 * All methods are invoked on the server's I/O threads. Messages from one
 * peer arrive in stream order; different peers may be delivered
 * concurrently. Implementations must not block indefinitely and must not
 * call PeerServer::stop() from inside a callback.
 *
 * Exceptions thrown from a callback are logged and otherwise ignored.
 */
class PeerController {
public:
  virtual ~PeerController() = default;

  // An inbound socket was accepted. Called before the connection is
  // registered, so PeerServer::send() to peer from inside this callback is
  // a silent no-op; confirm from another thread (or after the first
  // message) instead.
  virtual void incoming_connection(const protocol::PeerAddress& peer) = 0;

  // One decoded frame other than the CLOSE sentinel
  virtual void receive_remote_message(const protocol::PeerAddress& from, const std::string& payload) = 0;

  // The remote side went away (disconnect, malformed frame, or CLOSE).
  // Not called for connections closed locally.
  virtual void remote_close_connection(const protocol::PeerAddress& peer) = 0;
};

}  // namespace network
}  // namespace peerlink
