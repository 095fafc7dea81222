// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/tcp_connection.hpp"

#include "util/logging.hpp"

#include <cassert>

namespace peerlink {
namespace network {

std::shared_ptr<TcpConnection> TcpConnection::create(asio::io_context& io_context, asio::ip::tcp::socket socket,
                                                     protocol::PeerAddress peer, bool is_inbound) {
  return std::shared_ptr<TcpConnection>(new TcpConnection(io_context, std::move(socket), std::move(peer), is_inbound));
}

TcpConnection::TcpConnection(asio::io_context& io_context, asio::ip::tcp::socket socket, protocol::PeerAddress peer,
                             bool is_inbound)
    : io_context_(io_context),
      socket_(std::move(socket)),
      strand_(asio::make_strand(io_context)),
      peer_(std::move(peer)),
      is_inbound_(is_inbound) {
  open_.store(socket_.is_open(), std::memory_order_release);
}

TcpConnection::~TcpConnection() {}

void TcpConnection::start() {
  asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->is_open() || !self->reading_)
      return;
    self->start_read_impl();
  });
}

void TcpConnection::start_read_impl() {
  assert(strand_.running_in_this_thread());

  // Fresh buffer per read, kept alive by the handler
  auto buf = std::make_shared<std::vector<uint8_t>>(protocol::RECV_BUFFER_SIZE);

  auto read_handler = [this, self = shared_from_this(), buf](const asio::error_code& ec, size_t bytes_transferred) {
    // Closed locally or reading stopped meanwhile: no notification, no reschedule
    if (!is_open() || !reading_) {
      return;
    }

    if (ec) {
      handle_remote_close(ec);
      return;
    }

    if (bytes_transferred > 0 && receive_callback_) {
      ReceiveCallback saved_receive_cb = receive_callback_;
      std::vector<uint8_t> data(buf->begin(), buf->begin() + static_cast<std::ptrdiff_t>(bytes_transferred));
      try {
        saved_receive_cb(data);
      } catch (const std::exception& e) {
        LOG_NET_ERROR_RL(peer_.to_string(), "exception in receive callback from {}: {}", peer_.to_string(), e.what());
      }
    }

    // The callback may have closed the connection or stopped reading
    if (!is_open() || !reading_) {
      return;
    }

    start_read_impl();
  };

  socket_.async_read_some(asio::buffer(*buf), asio::bind_executor(strand_, read_handler));
}

void TcpConnection::send(const std::vector<uint8_t>& data) {
  if (!is_open()) {
    throw asio::system_error(asio::error::not_connected, "send to " + peer_.to_string());
  }

  // Copy before handing off to the strand; the caller's buffer may go away
  auto payload = std::make_shared<std::vector<uint8_t>>(data);

  if (on_io_thread()) {
    // Cannot wait here. A failed write closes the connection and is reported
    // through the disconnect callback.
    asio::dispatch(strand_, [self = shared_from_this(), payload]() { self->queue_write_impl(payload, nullptr); });
    return;
  }

  auto done = std::make_shared<std::promise<asio::error_code>>();
  std::future<asio::error_code> result = done->get_future();
  asio::dispatch(strand_, [self = shared_from_this(), payload, done]() { self->queue_write_impl(payload, done); });

  asio::error_code ec = result.get();
  if (ec) {
    LOG_NET_WARN_RL(peer_.to_string(), "write error to {}: {}", peer_.to_string(), ec.message());
    throw asio::system_error(ec, "send to " + peer_.to_string());
  }
}

void TcpConnection::queue_write_impl(std::shared_ptr<std::vector<uint8_t>> payload, WriteResult done) {
  assert(strand_.running_in_this_thread());

  if (!is_open()) {
    if (done) {
      done->set_value(asio::error::not_connected);
    }
    return;
  }

  send_queue_.push_back(PendingWrite{std::move(payload), std::move(done)});
  if (!writing_) {
    writing_ = true;
    do_write_impl();
  }
}

void TcpConnection::do_write_impl() {
  assert(strand_.running_in_this_thread());

  if (send_queue_.empty()) {
    writing_ = false;
    return;
  }

  auto data_ptr = send_queue_.front().data;

  auto write_handler = [this, self = shared_from_this(), data_ptr](const asio::error_code& ec,
                                                                     size_t /*bytes_transferred*/) {
    // Queue flushed by a close while this write was in flight
    if (send_queue_.empty() || send_queue_.front().data != data_ptr) {
      return;
    }

    PendingWrite finished = std::move(send_queue_.front());
    send_queue_.pop_front();
    if (finished.done) {
      finished.done->set_value(ec);
    }

    if (ec) {
      writing_ = false;
      handle_remote_close(ec);
      return;
    }

    do_write_impl();
  };

  asio::async_write(socket_, asio::buffer(*data_ptr), asio::bind_executor(strand_, write_handler));
}

void TcpConnection::handle_remote_close(const asio::error_code& ec) {
  assert(strand_.running_in_this_thread());

  if (!open_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  if (ec == asio::error::eof || ec == asio::error::connection_reset) {
    LOG_NET_DEBUG("{} closed the connection", peer_.to_string());
  } else {
    LOG_NET_DEBUG("connection to {} failed: {}", peer_.to_string(), ec.message());
  }

  shutdown_socket_impl(asio::error::not_connected);

  // Move to a local before invoking so the member is cleared even if it throws
  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  disconnect_callback_ = {};
  receive_callback_ = {};
  if (saved_disconnect_cb) {
    try {
      saved_disconnect_cb();
    } catch (const std::exception& e) {
      LOG_NET_ERROR("exception in disconnect callback for {}: {}", peer_.to_string(), e.what());
    }
  }
}

bool TcpConnection::close() {
  if (!open_.exchange(false, std::memory_order_acq_rel)) {
    return false;
  }

  asio::error_code close_ec;
  if (strand_.running_in_this_thread() || io_context_.stopped()) {
    // Already serialized: on the strand, or nothing is running the io_context
    close_ec = close_impl();
  } else if (on_io_thread()) {
    asio::post(strand_, [self = shared_from_this()]() {
      asio::error_code ec = self->close_impl();
      if (ec) {
        LOG_NET_WARN("failed to close connection to {}: {}", self->peer_.to_string(), ec.message());
      }
    });
    LOG_NET_DEBUG("closing connection to {}", peer_.to_string());
    return true;
  } else {
    auto done = std::make_shared<std::promise<asio::error_code>>();
    std::future<asio::error_code> result = done->get_future();
    asio::dispatch(strand_, [self = shared_from_this(), done]() { done->set_value(self->close_impl()); });
    close_ec = result.get();
  }

  if (close_ec) {
    LOG_NET_WARN("failed to close connection to {}: {}", peer_.to_string(), close_ec.message());
    throw asio::system_error(close_ec, "close " + peer_.to_string());
  }

  LOG_NET_DEBUG("closed connection to {}", peer_.to_string());
  return true;
}

asio::error_code TcpConnection::close_impl() {
  asio::error_code close_ec = shutdown_socket_impl(asio::error::operation_aborted);

  // Release callbacks (and whatever they captured). A receive callback that
  // is running right now holds its own copy.
  receive_callback_ = {};
  disconnect_callback_ = {};
  return close_ec;
}

asio::error_code TcpConnection::shutdown_socket_impl(const asio::error_code& pending_error) {
  // Pending async_read_some/async_write complete with operation_aborted
  asio::error_code ignored;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  asio::error_code close_ec;
  socket_.close(close_ec);

  std::deque<PendingWrite> flushed;
  flushed.swap(send_queue_);
  writing_ = false;
  for (auto& write : flushed) {
    if (write.done) {
      write.done->set_value(pending_error);
    }
  }
  return close_ec;
}

void TcpConnection::stop_reading() {
  asio::dispatch(strand_, [self = shared_from_this()]() {
    self->reading_ = false;
    self->receive_callback_ = {};
    self->disconnect_callback_ = {};
  });
}

void TcpConnection::set_receive_callback(ReceiveCallback callback) {
  asio::dispatch(strand_, [self = shared_from_this(), cb = std::move(callback)]() mutable {
    self->receive_callback_ = std::move(cb);
  });
}

void TcpConnection::set_disconnect_callback(DisconnectCallback callback) {
  asio::dispatch(strand_, [self = shared_from_this(), cb = std::move(callback)]() mutable {
    self->disconnect_callback_ = std::move(cb);
  });
}

}  // namespace network
}  // namespace peerlink
