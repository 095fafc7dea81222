// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "app_config.hpp"
#include "network/peer_controller.hpp"
#include "network/peer_server.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace peerlink {
namespace app {

/**
 * Application - console peer built on PeerServer
 *
 * Acts as the PeerController: prints peer events and messages, confirms
 * every inbound connection, and turns console lines into server calls.
 */
class Application : public network::PeerController {
public:
  explicit Application(const AppConfig& config, std::ostream& out);
  ~Application() override;

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  // Start the server, bind the listen port and dial the configured peers.
  // Returns false if the server could not be started or bound.
  bool start();

  // Read console commands from stdin until /quit, end of input or a
  // termination signal
  void run();

  void stop();

  // Execute one console line. Returns false for /quit.
  bool handle_command(const std::string& line);

  void request_shutdown() { shutdown_requested_ = true; }

  network::PeerServer* server() { return server_.get(); }

  static Application* instance();

  // PeerController
  void incoming_connection(const protocol::PeerAddress& peer) override;
  void receive_remote_message(const protocol::PeerAddress& from, const std::string& payload) override;
  void remote_close_connection(const protocol::PeerAddress& peer) override;

private:
  void setup_signal_handlers();
  static void signal_handler(int signal);

  // Inbound peers are confirmed from a separate thread: the controller is
  // told about them before they are registered
  void confirm_loop();

  void print(const std::string& line);
  void print_peers();
  void print_interfaces();
  void print_whoami();

  AppConfig config_;
  std::ostream& out_;
  std::mutex out_mutex_;

  std::unique_ptr<network::PeerServer> server_;

  std::thread confirm_thread_;
  std::mutex confirm_mutex_;
  std::condition_variable confirm_cv_;
  std::deque<protocol::PeerAddress> pending_confirm_;
  bool confirm_stop_{false};

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  static Application* instance_;
};

}  // namespace app
}  // namespace peerlink
