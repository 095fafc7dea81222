// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

// PeerController that records every callback and lets tests wait for them

#include "network/peer_controller.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace peerlink {
namespace test {

class RecordingController : public network::PeerController {
public:
    using Message = std::pair<protocol::PeerAddress, std::string>;

    void incoming_connection(const protocol::PeerAddress& peer) override {
        {
            std::lock_guard<std::mutex> lk(m_);
            incoming_.push_back(peer);
        }
        cv_.notify_all();
        if (on_incoming) on_incoming(peer);
    }

    void receive_remote_message(const protocol::PeerAddress& from, const std::string& payload) override {
        {
            std::lock_guard<std::mutex> lk(m_);
            messages_.emplace_back(from, payload);
        }
        cv_.notify_all();
        if (on_message) on_message(from, payload);
    }

    void remote_close_connection(const protocol::PeerAddress& peer) override {
        {
            std::lock_guard<std::mutex> lk(m_);
            closed_.push_back(peer);
        }
        cv_.notify_all();
    }

    // Hooks invoked after recording (run on the calling I/O thread)
    std::function<void(const protocol::PeerAddress&)> on_incoming;
    std::function<void(const protocol::PeerAddress&, const std::string&)> on_message;

    std::vector<protocol::PeerAddress> incoming() const {
        std::lock_guard<std::mutex> lk(m_);
        return incoming_;
    }
    std::vector<Message> messages() const {
        std::lock_guard<std::mutex> lk(m_);
        return messages_;
    }
    std::vector<protocol::PeerAddress> closed() const {
        std::lock_guard<std::mutex> lk(m_);
        return closed_;
    }

    bool wait_incoming(size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lk(m_);
        return cv_.wait_for(lk, timeout, [&] { return incoming_.size() >= n; });
    }
    bool wait_messages(size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lk(m_);
        return cv_.wait_for(lk, timeout, [&] { return messages_.size() >= n; });
    }
    bool wait_closed(size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lk(m_);
        return cv_.wait_for(lk, timeout, [&] { return closed_.size() >= n; });
    }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::vector<protocol::PeerAddress> incoming_;
    std::vector<Message> messages_;
    std::vector<protocol::PeerAddress> closed_;
};

}  // namespace test
}  // namespace peerlink
