// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/local_address.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <cerrno>
#include <system_error>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <asio.hpp>

namespace peerlink {
namespace util {

const char* const LOCAL_ADDRESS_CAVEAT =
    "The local network address is found by opening a connection towards a\n"
    "public host (internet access is suggested but not required) and reading\n"
    "the address the operating system picked for it. Several network adapters\n"
    "(ethernet, wifi, VPN, adapters created by virtual machine software or\n"
    "packet capture tools) can make this guess wrong. If peers cannot reach\n"
    "you, list the addresses of all adapters and choose one manually.";

std::string GetLocalAddress(const std::string& probe_host, uint16_t probe_port, std::chrono::milliseconds timeout) {
  asio::io_context io;

  asio::ip::tcp::resolver resolver(io);
  asio::error_code ec;
  auto endpoints = resolver.resolve(probe_host, std::to_string(probe_port), ec);
  if (ec) {
    LOG_NET_DEBUG("local address probe: cannot resolve {}: {}", probe_host, ec.message());
    throw asio::system_error(ec, "resolve " + probe_host);
  }

  asio::ip::tcp::socket socket(io);
  asio::error_code connect_ec = asio::error::would_block;
  asio::steady_timer deadline(io, timeout);

  deadline.async_wait([&](const asio::error_code& timer_ec) {
    if (!timer_ec && connect_ec == asio::error::would_block) {
      asio::error_code ignored;
      socket.close(ignored);
    }
  });

  asio::async_connect(socket, endpoints, [&](const asio::error_code& result, const asio::ip::tcp::endpoint&) {
    connect_ec = result;
    deadline.cancel();
  });

  io.run();

  if (connect_ec == asio::error::operation_aborted || connect_ec == asio::error::bad_descriptor) {
    connect_ec = asio::error::timed_out;
  }
  if (connect_ec) {
    LOG_NET_DEBUG("local address probe to {}:{} failed: {}", probe_host, probe_port, connect_ec.message());
    throw asio::system_error(connect_ec, "probe connect " + probe_host);
  }

  auto local = socket.local_endpoint(ec);
  if (ec) {
    throw asio::system_error(ec, "local_endpoint");
  }

  asio::error_code ignored;
  socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  socket.close(ignored);

  auto normalized = ValidateAndNormalizeIP(local.address().to_string());
  return normalized ? *normalized : local.address().to_string();
}

std::vector<InterfaceAddress> ListInterfaceAddresses() {
  struct ifaddrs* ifaddr = nullptr;
  if (getifaddrs(&ifaddr) == -1) {
    throw std::system_error(errno, std::generic_category(), "getifaddrs");
  }

  std::vector<InterfaceAddress> result;
  for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr) {
      continue;
    }

    char buf[INET6_ADDRSTRLEN] = {0};
    int family = ifa->ifa_addr->sa_family;
    if (family == AF_INET) {
      auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
      if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) == nullptr) {
        continue;
      }
    } else if (family == AF_INET6) {
      auto* sin6 = reinterpret_cast<struct sockaddr_in6*>(ifa->ifa_addr);
      if (inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf)) == nullptr) {
        continue;
      }
    } else {
      continue;
    }

    InterfaceAddress entry;
    entry.name = ifa->ifa_name ? ifa->ifa_name : "";
    entry.address = buf;
    entry.is_loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
    entry.is_up = (ifa->ifa_flags & IFF_UP) != 0;
    result.push_back(std::move(entry));
  }

  freeifaddrs(ifaddr);
  return result;
}

}  // namespace util
}  // namespace peerlink
