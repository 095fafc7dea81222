#include "util/netaddress.hpp"

#include "util/logging.hpp"

#include <cctype>

#include <asio/ip/address.hpp>

namespace peerlink {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }

    // ::ffff:192.168.1.1 -> 192.168.1.1
    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      auto v4 = asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6());
      return v4.to_string();
    }

    return ip.to_string();

  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

std::optional<uint16_t> ParsePort(const std::string& port_str) {
  if (port_str.empty() || port_str.size() > 5) {
    return std::nullopt;
  }
  uint32_t value = 0;
  for (char c : port_str) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }
  if (value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(value);
}

bool ParseHostPort(const std::string& host_port, std::string& out_host, uint16_t& out_port) {
  if (host_port.empty()) {
    return false;
  }

  std::string host;
  std::string port_str;

  if (host_port[0] == '[') {
    // "[IPv6]:port"
    size_t bracket_end = host_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false;
    }
    if (bracket_end + 1 >= host_port.size() || host_port[bracket_end + 1] != ':') {
      return false;
    }
    host = host_port.substr(1, bracket_end - 1);
    port_str = host_port.substr(bracket_end + 2);

    // Brackets are only meaningful around an IPv6 literal
    if (host.find(':') == std::string::npos) {
      return false;
    }
    auto normalized = ValidateAndNormalizeIP(host);
    if (!normalized) {
      return false;
    }
    host = *normalized;
  } else {
    size_t colon = host_port.find(':');
    if (colon == std::string::npos || colon == 0) {
      return false;
    }
    // Multiple colons: IPv6 without brackets
    if (host_port.find(':', colon + 1) != std::string::npos) {
      return false;
    }
    host = host_port.substr(0, colon);
    port_str = host_port.substr(colon + 1);

    if (auto normalized = ValidateAndNormalizeIP(host)) {
      host = *normalized;
    }
  }

  auto port = ParsePort(port_str);
  if (!port) {
    return false;
  }

  out_host = host;
  out_port = *port;
  return true;
}

std::string FormatHostPort(const std::string& host, uint16_t port) {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

bool IsSelfAddress(const std::string& address) {
  asio::error_code ec;
  auto ip = asio::ip::make_address(address, ec);
  if (ec) {
    return false;
  }

  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    ip = asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6());
  }
  return ip.is_loopback() || ip.is_unspecified();
}

}  // namespace util
}  // namespace peerlink
