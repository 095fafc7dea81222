// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/connection.hpp"
#include "network/connection_registry.hpp"
#include "network/frame.hpp"
#include "network/peer_controller.hpp"

#include <memory>

namespace peerlink {
namespace network {

/*
 PeerReader - per-connection decode loop

 Registers its connection, turns the incoming byte stream into frames and
 dispatches them to the controller until the stream ends.

 Lifetime:
 - The connection's callbacks hold the reader (shared_ptr)
 - The reader holds the connection weakly; the registry owns it
 - The cycle is broken when the connection clears its callbacks on close,
   or by the reader itself when it stops after a legacy sentinel

 All callbacks run on the connection's strand, so the members below need
 no locking.
*/
class PeerReader : public std::enable_shared_from_this<PeerReader> {
public:
  // registry and controller must outlive every I/O thread that can run
  // this reader
  static std::shared_ptr<PeerReader> create(const ConnectionPtr& conn, ConnectionRegistry& registry,
                                            PeerController& controller, bool close_on_sentinel);

  PeerReader(const PeerReader&) = delete;
  PeerReader& operator=(const PeerReader&) = delete;

  // Register the connection and start reading. A connection that is not
  // open is reported to the controller as a remote close, unregistered.
  void start();

  const protocol::PeerAddress& peer_address() const { return peer_; }

private:
  PeerReader(const ConnectionPtr& conn, ConnectionRegistry& registry, PeerController& controller,
             bool close_on_sentinel);

  void on_bytes(const std::vector<uint8_t>& data);
  void on_disconnect();
  void on_sentinel();

  // Close locally, deregister and notify. Skips the notification if the
  // connection had already been closed by someone else.
  void close_and_notify();

  void deregister_and_notify(const ConnectionPtr& conn);
  void notify_remote_close();

  std::weak_ptr<Connection> connection_;
  protocol::PeerAddress peer_;
  ConnectionRegistry& registry_;
  PeerController& controller_;
  bool close_on_sentinel_;

  frame::FrameDecoder decoder_;
  bool finished_{false};
};

}  // namespace network
}  // namespace peerlink
