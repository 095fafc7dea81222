// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/protocol.hpp"

#include "util/netaddress.hpp"

namespace peerlink {
namespace protocol {

std::string PeerAddress::to_string() const {
  return util::FormatHostPort(host, port);
}

size_t PeerAddressHash::operator()(const PeerAddress& addr) const noexcept {
  size_t h = std::hash<std::string>{}(addr.host);
  return h ^ (static_cast<size_t>(addr.port) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
}

}  // namespace protocol
}  // namespace peerlink
