// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_reader.hpp"

#include "util/logging.hpp"

#include <system_error>

namespace peerlink {
namespace network {

std::shared_ptr<PeerReader> PeerReader::create(const ConnectionPtr& conn, ConnectionRegistry& registry,
                                               PeerController& controller, bool close_on_sentinel) {
  return std::shared_ptr<PeerReader>(new PeerReader(conn, registry, controller, close_on_sentinel));
}

PeerReader::PeerReader(const ConnectionPtr& conn, ConnectionRegistry& registry, PeerController& controller,
                       bool close_on_sentinel)
    : connection_(conn),
      peer_(conn ? conn->peer_address() : protocol::PeerAddress{}),
      registry_(registry),
      controller_(controller),
      close_on_sentinel_(close_on_sentinel) {}

void PeerReader::start() {
  ConnectionPtr conn = connection_.lock();
  if (!conn || !conn->is_open()) {
    LOG_NET_DEBUG("stream to {} is not open, not registering", peer_.to_string());
    finished_ = true;
    notify_remote_close();
    return;
  }

  auto self = shared_from_this();
  conn->set_receive_callback([self](const std::vector<uint8_t>& data) { self->on_bytes(data); });
  conn->set_disconnect_callback([self]() { self->on_disconnect(); });

  ConnectionPtr replaced = registry_.insert(peer_, conn);
  if (replaced && replaced != conn) {
    LOG_NET_WARN("replacing existing connection to {}", peer_.to_string());
    try {
      replaced->close();
    } catch (const std::system_error& e) {
      LOG_NET_WARN("failed to close replaced connection to {}: {}", peer_.to_string(), e.what());
    }
  }

  LOG_NET_DEBUG("registered {} connection {}", conn->is_inbound() ? "inbound" : "outbound", peer_.to_string());
  conn->start();
}

void PeerReader::on_bytes(const std::vector<uint8_t>& data) {
  if (finished_) {
    return;
  }

  decoder_.feed(data);

  while (!finished_) {
    std::optional<std::string> payload = decoder_.next();
    if (!payload) {
      if (decoder_.failed()) {
        LOG_NET_WARN_RL(peer_.to_string(), "malformed frame from {}: {}", peer_.to_string(), decoder_.error());
        finished_ = true;
        close_and_notify();
      }
      return;
    }

    if (*payload == protocol::tags::CLOSE) {
      finished_ = true;
      on_sentinel();
      return;
    }

    try {
      controller_.receive_remote_message(peer_, *payload);
    } catch (const std::exception& e) {
      LOG_NET_ERROR("controller failed to handle message from {}: {}", peer_.to_string(), e.what());
    }

    // Closed locally from inside the callback (or concurrently): stop here
    ConnectionPtr conn = connection_.lock();
    if (!conn || !conn->is_open()) {
      finished_ = true;
      return;
    }
  }
}

void PeerReader::on_disconnect() {
  if (finished_) {
    return;
  }
  finished_ = true;

  ConnectionPtr conn = connection_.lock();
  if (!conn) {
    notify_remote_close();
    return;
  }
  deregister_and_notify(conn);
}

void PeerReader::on_sentinel() {
  if (close_on_sentinel_) {
    LOG_NET_DEBUG("CLOSE received from {}", peer_.to_string());
    close_and_notify();
    return;
  }

  // Legacy behaviour: stop reading but leave the socket open and registered
  LOG_NET_DEBUG("CLOSE received from {}, leaving connection registered", peer_.to_string());
  if (ConnectionPtr conn = connection_.lock()) {
    conn->stop_reading();
  }
}

void PeerReader::close_and_notify() {
  ConnectionPtr conn = connection_.lock();
  if (!conn) {
    return;
  }

  bool closed_here = false;
  try {
    closed_here = conn->close();
  } catch (const std::system_error& e) {
    // The socket is unusable either way
    LOG_NET_WARN("failed to close connection to {}: {}", peer_.to_string(), e.what());
    closed_here = true;
  }

  if (!closed_here) {
    // Somebody closed it locally first; that path owns the registry entry
    return;
  }
  deregister_and_notify(conn);
}

void PeerReader::deregister_and_notify(const ConnectionPtr& conn) {
  if (registry_.remove_if_same(peer_, conn)) {
    LOG_NET_DEBUG("deregistered {}", peer_.to_string());
  }
  notify_remote_close();
}

void PeerReader::notify_remote_close() {
  try {
    controller_.remote_close_connection(peer_);
  } catch (const std::exception& e) {
    LOG_NET_ERROR("controller failed to handle close of {}: {}", peer_.to_string(), e.what());
  }
}

}  // namespace network
}  // namespace peerlink
