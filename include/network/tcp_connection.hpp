// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/connection.hpp"

#include <atomic>
#include <deque>
#include <future>
#include <memory>

#include <asio.hpp>
#include <asio/strand.hpp>

namespace peerlink {
namespace network {

// TcpConnection - asio TCP socket implementation of Connection
//
// Threading:
// - Every operation on socket_ (read, write, shutdown, close) runs on strand_
// - send() queues the frame on the strand and waits for its async_write to
//   finish, unless called from one of the io_context's own threads
// - close() may be called from any thread, including from inside a callback
class TcpConnection : public Connection, public std::enable_shared_from_this<TcpConnection> {
public:
  // Wrap an already connected socket (accepted or dialed).
  // If the socket is not open, the connection starts out closed.
  static std::shared_ptr<TcpConnection> create(asio::io_context& io_context, asio::ip::tcp::socket socket,
                                               protocol::PeerAddress peer, bool is_inbound);

  ~TcpConnection() override;

  TcpConnection(const TcpConnection&) = delete;
  TcpConnection& operator=(const TcpConnection&) = delete;

  // Connection interface
  void start() override;
  void send(const std::vector<uint8_t>& data) override;
  bool close() override;
  void stop_reading() override;
  bool is_open() const override { return open_.load(std::memory_order_acquire); }
  const protocol::PeerAddress& peer_address() const override { return peer_; }
  bool is_inbound() const override { return is_inbound_; }
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

private:
  using WriteResult = std::shared_ptr<std::promise<asio::error_code>>;

  struct PendingWrite {
    std::shared_ptr<std::vector<uint8_t>> data;
    WriteResult done;  // null when the sender does not wait
  };

  TcpConnection(asio::io_context& io_context, asio::ip::tcp::socket socket, protocol::PeerAddress peer,
                bool is_inbound);

  // Strand-serialized internals
  void start_read_impl();
  void queue_write_impl(std::shared_ptr<std::vector<uint8_t>> payload, WriteResult done);
  void do_write_impl();
  void handle_remote_close(const asio::error_code& ec);
  asio::error_code close_impl();
  asio::error_code shutdown_socket_impl(const asio::error_code& pending_error);

  // True on a thread currently running io_context_ (blocking there could
  // starve the very handler being waited for)
  bool on_io_thread() const { return io_context_.get_executor().running_in_this_thread(); }

  asio::io_context& io_context_;
  asio::ip::tcp::socket socket_;
  asio::strand<asio::io_context::executor_type> strand_;
  protocol::PeerAddress peer_;
  bool is_inbound_;

  // Accessed only on strand_
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  std::deque<PendingWrite> send_queue_;
  bool writing_ = false;
  bool reading_ = true;

  std::atomic<bool> open_{false};
};

}  // namespace network
}  // namespace peerlink
