// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/peer_server.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace peerlink {
namespace app {

// Invalid command-line flag or config file content
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct AppConfig {
  uint16_t listen_port{0};            // 0 = OS-assigned
  std::vector<std::string> connect;  // "host:port" peers dialed at startup
  network::PeerServer::Config server_config;

  std::string log_level{"info"};
  std::string log_file;  // empty = console only
};

enum class CommandLineAction { Run, ShowHelp, ShowVersion };

// Merge keys of a JSON config file into config:
//   listen_port, io_threads, close_on_sentinel, advertised_address,
//   log_level, connect (array of "host:port")
// Unknown keys are ignored. Throws ConfigError if the file cannot be read,
// is not valid JSON, or a value has the wrong type or range.
void LoadConfigFile(const std::string& path, AppConfig& config);

// Parse argv into config. A --conf file is applied first, so flags override
// it regardless of order. Throws ConfigError on invalid input.
CommandLineAction ParseCommandLine(int argc, const char* const argv[], AppConfig& config);

void PrintUsage(const char* program_name);

}  // namespace app
}  // namespace peerlink
