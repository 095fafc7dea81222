// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 PeerServer - accepts and dials peers, tracks them, sends and broadcasts

 Owns the I/O thread pool, the listening socket and the connection
 registry. Each registered connection is driven by a PeerReader that
 forwards decoded frames to the PeerController.

 Threading:
 - Public methods may be called from any thread
 - connect_to(), send() and broadcast() block the calling thread
 - Controller callbacks run on the I/O threads; stop() must not be
   called from one of them
*/

#include "network/connection.hpp"
#include "network/connection_registry.hpp"
#include "network/peer_controller.hpp"
#include "network/protocol.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <asio/executor_work_guard.hpp>

namespace peerlink {

namespace test {
class PeerServerTestAccess;
}  // namespace test

namespace network {

class PeerServer {
public:
  struct Config {
    size_t io_threads;               // I/O worker threads (>= 1)
    bool close_on_sentinel;          // CLOSE tears the connection down (false = legacy: stop reading only)
    std::string advertised_address;  // Manual override for advertised_address() (empty = probe)
    std::string probe_host;          // Host used by the local address probe
    uint16_t probe_port;

    Config()
        : io_threads(2), close_on_sentinel(true), advertised_address(""), probe_host("google.com"), probe_port(80) {}
  };

  // Starts the I/O threads. Throws std::invalid_argument if io_threads is 0.
  explicit PeerServer(PeerController& controller, const Config& config = Config{});
  ~PeerServer();

  PeerServer(const PeerServer&) = delete;
  PeerServer& operator=(const PeerServer&) = delete;

  // === Listener ===

  // Bind port (0 = OS-assigned) and accept in the background. Replaces any
  // existing listener. Throws std::invalid_argument for a port outside
  // [0, 65535], std::system_error if the port cannot be bound.
  void start_listening(int port = 0);

  // Rebind the most recently bound port. Throws std::logic_error if
  // start_listening() never succeeded.
  void restart_listening();

  void stop_listening();

  // Bound port, 0 when not listening
  uint16_t local_port() const { return listen_port_.load(std::memory_order_acquire); }

  // === Outbound ===

  // Dial address:port, register the connection and start reading.
  // Returns the registry key of the new connection.
  // Throws:
  // - std::invalid_argument: port out of range, or the target is this
  //   server's own listening endpoint (checked before dialing)
  // - std::system_error: host_not_found if address does not resolve, or the
  //   dial error
  protocol::PeerAddress connect_to(const std::string& address, int port);

  // === Sending ===

  // Send one frame to target. Unregistered targets are logged and ignored.
  // Throws std::invalid_argument for an unencodable payload,
  // std::system_error if the write fails.
  void send(const protocol::PeerAddress& target, const std::string& message);

  // Send one frame to every registered peer in registration order. Stops at
  // the first failed write and rethrows it.
  void broadcast(const std::string& message);

  // Acknowledge a peer with the [CONFIRM] frame
  void confirm_connection(const protocol::PeerAddress& peer);

  // === Teardown ===

  // Deregister and close. No-op if not registered. Throws std::system_error
  // if closing the socket fails (the entry is removed regardless).
  void close_connection(const protocol::PeerAddress& peer);

  // Close every registered connection. All are attempted; the first failure
  // is rethrown afterwards.
  void close_all_connections();

  // === Queries ===

  // True iff at least one registered connection is open
  bool has_connection() const { return registry_.any_open(); }
  size_t connection_count() const { return registry_.size(); }
  std::vector<protocol::PeerAddress> peers() const { return registry_.addresses(); }

  // Configured advertised address, else the result of the local address
  // probe. Throws std::system_error if probing fails.
  std::string advertised_address() const;

  // Stop listening, close all connections, stop and join the I/O threads.
  // Idempotent. Throws std::logic_error if called from an I/O thread.
  void stop();

private:
  friend class test::PeerServerTestAccess;

  using Acceptor = asio::ip::tcp::acceptor;

  // Called with listen_mutex_ held
  void start_accept_locked(const std::shared_ptr<Acceptor>& acceptor);
  void close_acceptor_locked();

  void handle_accept(const std::shared_ptr<Acceptor>& acceptor, const asio::error_code& ec,
                     asio::ip::tcp::socket socket);
  void start_reader(const ConnectionPtr& conn);

  PeerController& controller_;
  Config config_;

  asio::io_context io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> io_threads_;

  // Listener state
  std::mutex listen_mutex_;
  std::shared_ptr<Acceptor> acceptor_;       // null when not listening
  std::optional<uint16_t> last_listen_port_;  // for restart_listening()
  std::atomic<uint16_t> listen_port_{0};

  ConnectionRegistry registry_;

  std::mutex stop_mutex_;
  std::atomic<bool> stopped_{false};
};

}  // namespace network
}  // namespace peerlink
