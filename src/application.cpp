// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"

#include "util/local_address.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <poll.h>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace peerlink {
namespace app {

namespace {

protocol::PeerAddress ParseTarget(const std::string& host_port) {
  std::string host;
  uint16_t port = 0;
  if (!util::ParseHostPort(host_port, host, port)) {
    throw std::invalid_argument("expected host:port, got '" + host_port + "'");
  }
  return protocol::PeerAddress(host, port);
}

// True when a line can be read from stdin without blocking past timeout
bool WaitForInput(std::chrono::milliseconds timeout) {
  if (std::cin.rdbuf()->in_avail() > 0) {
    return true;
  }
  pollfd pfd{};
  pfd.fd = STDIN_FILENO;
  pfd.events = POLLIN;
  return ::poll(&pfd, 1, static_cast<int>(timeout.count())) > 0;
}

}  // namespace

// Static instance for signal handling
Application* Application::instance_ = nullptr;

Application::Application(const AppConfig& config, std::ostream& out) : config_(config), out_(out) {
  instance_ = this;
}

Application::~Application() {
  try {
    stop();
  } catch (const std::exception& e) {
    LOG_APP_ERROR("error during shutdown: {}", e.what());
  }
  instance_ = nullptr;
}

Application* Application::instance() {
  return instance_;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("application already running");
    return false;
  }

  setup_signal_handlers();

  try {
    server_ = std::make_unique<network::PeerServer>(*this, config_.server_config);
    server_->start_listening(config_.listen_port);
  } catch (const std::exception& e) {
    LOG_APP_ERROR("failed to start peer server: {}", e.what());
    server_.reset();
    return false;
  }

  confirm_stop_ = false;
  confirm_thread_ = std::thread(&Application::confirm_loop, this);
  running_ = true;

  print("listening on port " + std::to_string(server_->local_port()));

  for (const auto& peer : config_.connect) {
    handle_command("/connect " + peer);
  }

  LOG_APP_INFO("peerlink started, {} I/O threads", config_.server_config.io_threads);
  return true;
}

void Application::run() {
  std::string line;
  while (running_ && !shutdown_requested_) {
    if (!WaitForInput(std::chrono::milliseconds(100))) {
      continue;
    }
    if (!std::getline(std::cin, line)) {
      LOG_APP_DEBUG("end of input");
      break;
    }
    if (!handle_command(line)) {
      break;
    }
  }
}

void Application::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_APP_INFO("shutting down");

  {
    std::lock_guard<std::mutex> lock(confirm_mutex_);
    confirm_stop_ = true;
  }
  confirm_cv_.notify_all();
  if (confirm_thread_.joinable()) {
    confirm_thread_.join();
  }

  if (server_) {
    server_->stop();
  }

  LOG_APP_INFO("shutdown complete");
}

bool Application::handle_command(const std::string& line) {
  if (line.empty()) {
    return true;
  }
  if (!server_) {
    print("server is not running");
    return line != "/quit";
  }

  try {
    if (line[0] != '/') {
      if (server_->connection_count() == 0) {
        print("no peers connected");
      } else {
        server_->broadcast(line);
      }
      return true;
    }

    std::istringstream iss(line);
    std::string cmd;
    std::string arg;
    iss >> cmd >> arg;
    std::string text;
    std::getline(iss, text);
    if (!text.empty() && text[0] == ' ') {
      text.erase(0, 1);
    }

    if (cmd == "/quit") {
      return false;
    } else if (cmd == "/help") {
      PrintUsage("peerlink");
    } else if (cmd == "/peers") {
      print_peers();
    } else if (cmd == "/ifaces") {
      print_interfaces();
    } else if (cmd == "/whoami") {
      print_whoami();
    } else if (cmd == "/closeall") {
      server_->close_all_connections();
      print("closed all connections");
    } else if (cmd == "/connect") {
      std::string host;
      uint16_t port = 0;
      if (!util::ParseHostPort(arg, host, port)) {
        throw std::invalid_argument("expected host:port, got '" + arg + "'");
      }
      protocol::PeerAddress peer = server_->connect_to(host, port);
      print("* connected to " + peer.to_string());
    } else if (cmd == "/close") {
      protocol::PeerAddress peer = ParseTarget(arg);
      server_->close_connection(peer);
      print("* closed " + peer.to_string());
    } else if (cmd == "/confirm") {
      server_->confirm_connection(ParseTarget(arg));
    } else if (cmd == "/send") {
      protocol::PeerAddress peer = ParseTarget(arg);
      auto peers = server_->peers();
      if (std::find(peers.begin(), peers.end(), peer) == peers.end()) {
        print("not connected to " + peer.to_string());
      } else {
        server_->send(peer, text);
      }
    } else {
      print("unknown command " + cmd + " (try /help)");
    }
  } catch (const std::exception& e) {
    print(std::string("error: ") + e.what());
  }
  return true;
}

// ============================================================================
// PeerController
// ============================================================================

void Application::incoming_connection(const protocol::PeerAddress& peer) {
  print("* " + peer.to_string() + " connected");
  {
    std::lock_guard<std::mutex> lock(confirm_mutex_);
    pending_confirm_.push_back(peer);
  }
  confirm_cv_.notify_one();
}

void Application::receive_remote_message(const protocol::PeerAddress& from, const std::string& payload) {
  if (payload == protocol::tags::CONFIRM) {
    print("* " + from.to_string() + " confirmed the connection");
    return;
  }
  print("[" + from.to_string() + "] " + payload);
}

void Application::remote_close_connection(const protocol::PeerAddress& peer) {
  print("* " + peer.to_string() + " disconnected");
}

void Application::confirm_loop() {
  using namespace std::chrono;

  std::unique_lock<std::mutex> lock(confirm_mutex_);
  while (true) {
    confirm_cv_.wait(lock, [this]() { return confirm_stop_ || !pending_confirm_.empty(); });
    if (confirm_stop_) {
      return;
    }
    protocol::PeerAddress peer = pending_confirm_.front();
    pending_confirm_.pop_front();

    // Registration follows incoming_connection() on the I/O thread
    const auto deadline = steady_clock::now() + seconds(2);
    bool registered = false;
    while (!confirm_stop_ && steady_clock::now() < deadline) {
      lock.unlock();
      auto peers = server_->peers();
      registered = std::find(peers.begin(), peers.end(), peer) != peers.end();
      lock.lock();
      if (registered) {
        break;
      }
      confirm_cv_.wait_for(lock, milliseconds(10), [this]() { return confirm_stop_; });
    }
    if (!registered) {
      LOG_APP_DEBUG("{} went away before it could be confirmed", peer.to_string());
      continue;
    }

    lock.unlock();
    try {
      server_->confirm_connection(peer);
      LOG_APP_DEBUG("confirmed {}", peer.to_string());
    } catch (const std::exception& e) {
      LOG_APP_WARN("failed to confirm {}: {}", peer.to_string(), e.what());
    }
    lock.lock();
  }
}

// ============================================================================
// Console output
// ============================================================================

void Application::print(const std::string& line) {
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << line << std::endl;
}

void Application::print_peers() {
  auto peers = server_->peers();
  if (peers.empty()) {
    print("no peers connected");
    return;
  }
  std::ostringstream oss;
  oss << peers.size() << " peer(s):";
  for (const auto& peer : peers) {
    oss << "\n  " << peer.to_string();
  }
  print(oss.str());
}

void Application::print_interfaces() {
  std::ostringstream oss;
  for (const auto& iface : util::ListInterfaceAddresses()) {
    oss << "  " << iface.name << "  " << iface.address;
    if (iface.is_loopback) {
      oss << "  (loopback)";
    }
    if (!iface.is_up) {
      oss << "  (down)";
    }
    oss << "\n";
  }
  std::string text = oss.str();
  if (!text.empty()) {
    text.pop_back();
  }
  print(text.empty() ? "no interfaces found" : text);
}

void Application::print_whoami() {
  std::string address = server_->advertised_address();
  print("advertised address: " + address + ", listening on port " + std::to_string(server_->local_port()));
  if (config_.server_config.advertised_address.empty()) {
    print(util::LOCAL_ADDRESS_CAVEAT);
  }
}

// ============================================================================
// Signals
// ============================================================================

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  // Ignore SIGPIPE so a peer closing mid-write surfaces as a write error
  std::signal(SIGPIPE, SIG_IGN);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout is NOT safe)
    static const char msg[] = "\nReceived signal\n";
    (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);
    instance_->shutdown_requested_ = true;
  }
}

}  // namespace app
}  // namespace peerlink
