// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_server.hpp"

#include "network/frame.hpp"
#include "network/peer_reader.hpp"
#include "network/tcp_connection.hpp"
#include "util/local_address.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <exception>
#include <stdexcept>

namespace peerlink {
namespace network {

namespace {

using tcp = asio::ip::tcp;

void CheckPort(int port) {
  if (port < 0 || port > 65535) {
    throw std::invalid_argument("port out of range: " + std::to_string(port));
  }
}

// Registry key for a connected endpoint (IPv4-mapped addresses become IPv4)
protocol::PeerAddress ToPeerAddress(const tcp::endpoint& ep) {
  std::string raw = ep.address().to_string();
  return protocol::PeerAddress(util::ValidateAndNormalizeIP(raw).value_or(raw), ep.port());
}

void SetSocketOptions(tcp::socket& socket) {
  // Best-effort; failures only cost latency
  asio::error_code ec;
  socket.set_option(tcp::no_delay(true), ec);
  socket.set_option(asio::socket_base::keep_alive(true), ec);
}

}  // namespace

PeerServer::PeerServer(PeerController& controller, const Config& config) : controller_(controller), config_(config) {
  if (config_.io_threads < 1) {
    throw std::invalid_argument("io_threads must be at least 1");
  }

  work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
      asio::make_work_guard(io_context_));
  for (size_t i = 0; i < config_.io_threads; ++i) {
    io_threads_.emplace_back([this]() { io_context_.run(); });
  }
  LOG_NET_DEBUG("peer server started with {} I/O threads", config_.io_threads);
}

PeerServer::~PeerServer() {
  try {
    stop();
  } catch (const std::exception& e) {
    LOG_NET_ERROR("error while stopping peer server: {}", e.what());
  }
}

// ============================================================================
// Listener
// ============================================================================

void PeerServer::start_listening(int port) {
  CheckPort(port);
  if (stopped_.load(std::memory_order_acquire)) {
    throw std::logic_error("start_listening() on a stopped server");
  }

  std::lock_guard<std::mutex> lock(listen_mutex_);

  if (acceptor_) {
    LOG_NET_INFO("closing listener on port {} before rebinding", listen_port_.load());
    close_acceptor_locked();
  }

  auto acceptor = std::make_shared<Acceptor>(io_context_);
  const auto requested = static_cast<uint16_t>(port);

  try {
    // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only on failure
    try {
      acceptor->open(tcp::v6());
      acceptor->set_option(asio::ip::v6_only(false));
      acceptor->set_option(Acceptor::reuse_address(true));
      acceptor->bind(tcp::endpoint(tcp::v6(), requested));
      acceptor->listen(asio::socket_base::max_listen_connections);
    } catch (const asio::system_error& e) {
      LOG_NET_DEBUG("dual-stack bind on port {} failed ({}), trying IPv4", port, e.what());
      asio::error_code ec;
      acceptor->close(ec);
      acceptor->open(tcp::v4());
      acceptor->set_option(Acceptor::reuse_address(true));
      acceptor->bind(tcp::endpoint(tcp::v4(), requested));
      acceptor->listen(asio::socket_base::max_listen_connections);
    }
  } catch (const asio::system_error& e) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, e.what());
    asio::error_code ec;
    acceptor->close(ec);
    throw;
  }

  // Record the actual bound port (handles ephemeral port 0)
  const uint16_t bound = acceptor->local_endpoint().port();
  acceptor_ = acceptor;
  last_listen_port_ = bound;
  listen_port_.store(bound, std::memory_order_release);

  LOG_NET_INFO("listening on port {}", bound);
  start_accept_locked(acceptor);
}

void PeerServer::restart_listening() {
  std::optional<uint16_t> port;
  {
    std::lock_guard<std::mutex> lock(listen_mutex_);
    port = last_listen_port_;
  }
  if (!port) {
    throw std::logic_error("restart_listening() before any successful start_listening()");
  }
  start_listening(*port);
}

void PeerServer::stop_listening() {
  std::lock_guard<std::mutex> lock(listen_mutex_);
  if (!acceptor_) {
    return;
  }
  LOG_NET_INFO("stopped listening on port {}", listen_port_.load());
  close_acceptor_locked();
}

void PeerServer::close_acceptor_locked() {
  asio::error_code ec;
  acceptor_->close(ec);
  if (ec) {
    LOG_NET_WARN("error closing listener: {}", ec.message());
  }
  acceptor_.reset();
  listen_port_.store(0, std::memory_order_release);
}

void PeerServer::start_accept_locked(const std::shared_ptr<Acceptor>& acceptor) {
  if (!acceptor->is_open()) {
    LOG_NET_DEBUG("listener already closed, accept loop not started");
    return;
  }

  // The acceptor is captured so a replaced listener's loop can tell it is stale
  acceptor->async_accept([this, acceptor](const asio::error_code& ec, tcp::socket socket) {
    handle_accept(acceptor, ec, std::move(socket));
  });
}

void PeerServer::handle_accept(const std::shared_ptr<Acceptor>& acceptor, const asio::error_code& ec,
                               tcp::socket socket) {
  {
    std::lock_guard<std::mutex> lock(listen_mutex_);

    // Closed by stop_listening() or replaced by start_listening(): loop ends
    if (acceptor_ != acceptor || ec == asio::error::operation_aborted) {
      LOG_NET_DEBUG("accept loop ended");
      return;
    }

    start_accept_locked(acceptor);
  }

  if (ec) {
    LOG_NET_WARN_RL("listener", "accept error: {}", ec.message());
    return;
  }

  asio::error_code ep_ec;
  tcp::endpoint remote = socket.remote_endpoint(ep_ec);
  if (ep_ec) {
    LOG_NET_DEBUG("accepted socket went away before it could be used: {}", ep_ec.message());
    return;
  }
  SetSocketOptions(socket);

  protocol::PeerAddress peer = ToPeerAddress(remote);
  LOG_NET_INFO("accepted connection from {}", peer.to_string());

  try {
    controller_.incoming_connection(peer);
  } catch (const std::exception& e) {
    LOG_NET_ERROR("controller failed to handle incoming connection from {}: {}", peer.to_string(), e.what());
  }

  start_reader(TcpConnection::create(io_context_, std::move(socket), peer, true));
}

void PeerServer::start_reader(const ConnectionPtr& conn) {
  PeerReader::create(conn, registry_, controller_, config_.close_on_sentinel)->start();
}

// ============================================================================
// Outbound
// ============================================================================

protocol::PeerAddress PeerServer::connect_to(const std::string& address, int port) {
  CheckPort(port);
  if (stopped_.load(std::memory_order_acquire)) {
    throw std::logic_error("connect_to() on a stopped server");
  }

  const std::string target = util::FormatHostPort(address, static_cast<uint16_t>(port));

  tcp::resolver resolver(io_context_);
  asio::error_code ec;
  auto endpoints = resolver.resolve(address, std::to_string(port), tcp::resolver::numeric_service, ec);
  if (ec || endpoints.empty()) {
    LOG_NET_WARN("cannot resolve {}: {}", address, ec ? ec.message() : "no addresses");
    throw asio::system_error(asio::error::host_not_found, "resolve " + address);
  }

  const uint16_t listening = local_port();
  if (listening != 0 && port == listening) {
    for (const auto& entry : endpoints) {
      if (util::IsSelfAddress(entry.endpoint().address().to_string())) {
        LOG_NET_WARN("refusing to connect to own listener at {}", target);
        throw std::invalid_argument("refusing to connect to self: " + target);
      }
    }
  }

  tcp::socket socket(io_context_);
  asio::connect(socket, endpoints, ec);
  if (ec) {
    LOG_NET_WARN("connect to {} failed: {}", target, ec.message());
    throw asio::system_error(ec, "connect to " + target);
  }
  SetSocketOptions(socket);

  tcp::endpoint remote = socket.remote_endpoint(ec);
  if (ec) {
    throw asio::system_error(ec, "connect to " + target);
  }

  protocol::PeerAddress peer = ToPeerAddress(remote);
  LOG_NET_INFO("connected to {}", peer.to_string());

  start_reader(TcpConnection::create(io_context_, std::move(socket), peer, false));
  return peer;
}

// ============================================================================
// Sending
// ============================================================================

void PeerServer::send(const protocol::PeerAddress& target, const std::string& message) {
  ConnectionPtr conn = registry_.get(target);
  if (!conn) {
    LOG_NET_WARN("no connection to {}, message dropped", target.to_string());
    return;
  }

  std::vector<uint8_t> frame = frame::EncodeFrame(message);
  conn->send(frame);
  LOG_NET_TRACE("sent {} bytes to {}", message.size(), target.to_string());
}

void PeerServer::broadcast(const std::string& message) {
  std::vector<ConnectionRegistry::Entry> targets = registry_.snapshot();
  if (targets.empty()) {
    LOG_NET_DEBUG("broadcast with no connected peers");
    return;
  }

  // Encode once for all peers
  std::vector<uint8_t> frame = frame::EncodeFrame(message);

  for (const auto& [addr, conn] : targets) {
    try {
      conn->send(frame);
    } catch (const std::system_error& e) {
      LOG_NET_WARN("broadcast to {} failed, remaining peers skipped: {}", addr.to_string(), e.what());
      throw;
    }
  }
  LOG_NET_TRACE("broadcast {} bytes to {} peers", message.size(), targets.size());
}

void PeerServer::confirm_connection(const protocol::PeerAddress& peer) {
  send(peer, protocol::tags::CONFIRM);
}

// ============================================================================
// Teardown
// ============================================================================

void PeerServer::close_connection(const protocol::PeerAddress& peer) {
  // Remove first so the reader sees a local close and stays quiet
  ConnectionPtr conn = registry_.remove(peer);
  if (!conn) {
    LOG_NET_DEBUG("close_connection: {} not registered", peer.to_string());
    return;
  }

  if (conn->close()) {
    LOG_NET_INFO("closed connection to {}", peer.to_string());
  }
}

void PeerServer::close_all_connections() {
  std::exception_ptr first_error;

  for (const auto& peer : registry_.addresses()) {
    try {
      close_connection(peer);
    } catch (const std::system_error& e) {
      LOG_NET_WARN("failed to close {}: {}", peer.to_string(), e.what());
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

std::string PeerServer::advertised_address() const {
  if (!config_.advertised_address.empty()) {
    return config_.advertised_address;
  }
  return util::GetLocalAddress(config_.probe_host, config_.probe_port);
}

// ============================================================================
// Lifecycle
// ============================================================================

void PeerServer::stop() {
  if (io_context_.get_executor().running_in_this_thread()) {
    throw std::logic_error("PeerServer::stop() called from an I/O thread");
  }

  std::lock_guard<std::mutex> lock(stop_mutex_);
  if (stopped_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  // SHUTDOWN SEQUENCE
  // 1. Stop accepting
  stop_listening();

  // 2. Close peers while the I/O threads still run, so pending reads
  //    complete and release their connections
  try {
    close_all_connections();
  } catch (const std::system_error& e) {
    LOG_NET_WARN("error closing connections during shutdown: {}", e.what());
  }

  // 3. Stop the event loop and join
  work_guard_.reset();
  io_context_.stop();
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  LOG_NET_DEBUG("peer server stopped");
}

}  // namespace network
}  // namespace peerlink
