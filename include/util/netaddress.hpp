#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings
 - Parse and format "host:port" endpoints
 - Classify addresses that denote this machine (loopback / unspecified)

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - ParseHostPort: Splits "host:port" / "[v6]:port" into components
 - IsSelfAddress: true for loopback and any-local (0.0.0.0, ::) addresses
*/

#include <cstdint>
#include <optional>
#include <string>

namespace peerlink {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps asio::ip::make_address() and normalizes IPv4-mapped IPv6 addresses
 * to IPv4 (::ffff:1.2.3.4 -> 1.2.3.4). A dual-stack listener reports IPv4
 * peers in mapped form; without normalization the same peer would appear
 * under two registry keys depending on which side dialed.
 *
 * Hostnames are rejected (numeric addresses only).
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:db8::1" -> "2001:db8::1"
 *   "invalid" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

bool IsValidIPAddress(const std::string& address);

// Parse a decimal port (0-65535). Rejects signs, whitespace and trailing characters.
std::optional<uint16_t> ParsePort(const std::string& port_str);

/**
 * Parse "host:port" into host and port
 *
 * Accepted forms:
 * - "192.168.1.1:9590"
 * - "[2001:db8::1]:9590"
 * - "example.org:9590" (hostname kept verbatim, resolved later by the caller)
 *
 * Numeric hosts are normalized. Unbracketed IPv6 is rejected.
 */
bool ParseHostPort(const std::string& host_port, std::string& out_host, uint16_t& out_port);

// Format an endpoint as "host:port", bracketing IPv6 hosts
std::string FormatHostPort(const std::string& host, uint16_t port);

// True if the address is loopback (127.0.0.0/8, ::1) or unspecified (0.0.0.0, ::).
// Invalid addresses return false.
bool IsSelfAddress(const std::string& address);

}  // namespace util
}  // namespace peerlink
