// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/connection_registry.hpp"

#include <algorithm>

namespace peerlink {
namespace network {

std::vector<ConnectionRegistry::Entry>::iterator ConnectionRegistry::find_locked(const protocol::PeerAddress& addr) {
  return std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == addr; });
}

std::vector<ConnectionRegistry::Entry>::const_iterator ConnectionRegistry::find_locked(
    const protocol::PeerAddress& addr) const {
  return std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == addr; });
}

ConnectionPtr ConnectionRegistry::insert(const protocol::PeerAddress& addr, ConnectionPtr conn) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_locked(addr);
  if (it != entries_.end()) {
    ConnectionPtr previous = std::move(it->second);
    it->second = std::move(conn);
    return previous;
  }
  entries_.emplace_back(addr, std::move(conn));
  return nullptr;
}

ConnectionPtr ConnectionRegistry::get(const protocol::PeerAddress& addr) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_locked(addr);
  return it != entries_.end() ? it->second : nullptr;
}

bool ConnectionRegistry::contains(const protocol::PeerAddress& addr) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return find_locked(addr) != entries_.end();
}

ConnectionPtr ConnectionRegistry::remove(const protocol::PeerAddress& addr) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_locked(addr);
  if (it == entries_.end()) {
    return nullptr;
  }
  ConnectionPtr removed = std::move(it->second);
  entries_.erase(it);
  return removed;
}

bool ConnectionRegistry::remove_if_same(const protocol::PeerAddress& addr, const ConnectionPtr& conn) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_locked(addr);
  if (it == entries_.end() || it->second != conn) {
    return false;
  }
  entries_.erase(it);
  return true;
}

std::vector<ConnectionRegistry::Entry> ConnectionRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

std::vector<protocol::PeerAddress> ConnectionRegistry::addresses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<protocol::PeerAddress> result;
  result.reserve(entries_.size());
  for (const auto& [addr, conn] : entries_) {
    result.push_back(addr);
  }
  return result;
}

size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

bool ConnectionRegistry::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.empty();
}

bool ConnectionRegistry::any_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::any_of(entries_.begin(), entries_.end(),
                     [](const Entry& e) { return e.second && e.second->is_open(); });
}

}  // namespace network
}  // namespace peerlink
