// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ConnectionRegistry - the set of live peers, keyed by PeerAddress

 Presence of an entry means the connection is believed open. Entries are
 kept in insertion order; broadcast and close-all walk that order.

 Thread-safety: every method takes mutex_ and is individually atomic.
 Iteration happens over snapshots so no lock is held while doing I/O.
*/

#include "network/connection.hpp"
#include "network/protocol.hpp"

#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>

namespace peerlink {
namespace network {

class ConnectionRegistry {
public:
  using Entry = std::pair<protocol::PeerAddress, ConnectionPtr>;

  // Insert or replace. Returns the connection previously registered under
  // addr (nullptr if none). A replaced entry keeps its position.
  ConnectionPtr insert(const protocol::PeerAddress& addr, ConnectionPtr conn);

  // nullptr if not registered
  ConnectionPtr get(const protocol::PeerAddress& addr) const;

  bool contains(const protocol::PeerAddress& addr) const;

  // Remove and return the entry for addr (nullptr if none)
  ConnectionPtr remove(const protocol::PeerAddress& addr);

  // Remove only if addr still maps to conn. Returns true if removed.
  bool remove_if_same(const protocol::PeerAddress& addr, const ConnectionPtr& conn);

  // Point-in-time copy in insertion order
  std::vector<Entry> snapshot() const;
  std::vector<protocol::PeerAddress> addresses() const;

  size_t size() const;
  bool empty() const;

  // True iff at least one registered connection reports open
  bool any_open() const;

private:
  std::vector<Entry>::iterator find_locked(const protocol::PeerAddress& addr);
  std::vector<Entry>::const_iterator find_locked(const protocol::PeerAddress& addr) const;

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};

}  // namespace network
}  // namespace peerlink
