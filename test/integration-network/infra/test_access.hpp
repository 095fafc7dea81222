// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

// Friend classes for accessing internal state in tests.
// This pattern keeps test-only methods out of production headers
// while allowing tests to manipulate internal state when needed.

#include "network/connection_registry.hpp"
#include "network/peer_server.hpp"

namespace peerlink {
namespace test {

// Friend class for accessing PeerServer internals in tests
class PeerServerTestAccess {
public:
  static network::ConnectionRegistry& GetRegistry(network::PeerServer& server) { return server.registry_; }

  // Attach a connection exactly as an accepted or dialed socket would be:
  // a reader is created, registers it and starts it
  static void Attach(network::PeerServer& server, const network::ConnectionPtr& conn) { server.start_reader(conn); }
};

}  // namespace test
}  // namespace peerlink
