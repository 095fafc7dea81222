// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace peerlink {
namespace util {

// Operator-facing explanation of why GetLocalAddress() may be wrong
extern const char* const LOCAL_ADDRESS_CAVEAT;

// Best-effort discovery of the LAN-facing address of this host.
//
// Opens a throwaway TCP connection to probe_host:probe_port so the OS picks
// the outbound interface, then reads the locally bound address off the
// socket. No data is exchanged. On hosts with several adapters (VPN,
// virtual machines, VLANs) the result may not be reachable by the intended
// peer; treat it as advisory.
//
// Throws std::system_error if the probe host cannot be resolved, no route
// exists, or the probe does not complete within timeout.
std::string GetLocalAddress(const std::string& probe_host = "google.com", uint16_t probe_port = 80,
                            std::chrono::milliseconds timeout = std::chrono::seconds(3));

struct InterfaceAddress {
  std::string name;     // Interface name (eth0, wlan0, ...)
  std::string address;  // Numeric address, IPv4 or IPv6
  bool is_loopback{false};
  bool is_up{false};
};

// Enumerate the addresses of all network interfaces (getifaddrs), so an
// operator can pick the right one by hand when GetLocalAddress() guesses
// wrong. Throws std::system_error if enumeration fails.
std::vector<InterfaceAddress> ListInterfaceAddresses();

}  // namespace util
}  // namespace peerlink
