// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app_config.hpp"

#include "util/netaddress.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <fstream>
#include <iostream>
#include <optional>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace peerlink {
namespace app {

namespace {

constexpr std::array<const char*, 7> LOG_LEVELS = {"trace", "debug", "info", "warn", "error", "critical", "off"};

std::string CheckLogLevel(const std::string& level) {
  if (std::find(LOG_LEVELS.begin(), LOG_LEVELS.end(), level) == LOG_LEVELS.end()) {
    throw ConfigError("invalid log level '" + level + "' (trace, debug, info, warn, error, critical, off)");
  }
  return level;
}

std::string CheckPeer(const std::string& host_port) {
  std::string host;
  uint16_t port = 0;
  if (!util::ParseHostPort(host_port, host, port)) {
    throw ConfigError("invalid peer address '" + host_port + "' (expected host:port)");
  }
  return host_port;
}

std::string CheckAdvertised(const std::string& address) {
  auto normalized = util::ValidateAndNormalizeIP(address);
  if (!normalized) {
    throw ConfigError("invalid advertised address '" + address + "' (numeric IP expected)");
  }
  return *normalized;
}

size_t CheckThreads(int threads) {
  if (threads < 1 || threads > 64) {
    throw ConfigError("invalid thread count " + std::to_string(threads) + " (1-64)");
  }
  return static_cast<size_t>(threads);
}

size_t ParseThreads(const std::string& value) {
  int threads = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), threads);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    throw ConfigError("invalid thread count '" + value + "'");
  }
  return CheckThreads(threads);
}

// "--name=value" -> value, or nullopt if arg is not that flag
std::optional<std::string> FlagValue(const std::string& arg, const std::string& name) {
  const std::string prefix = name + "=";
  if (arg.rfind(prefix, 0) != 0) {
    return std::nullopt;
  }
  std::string value = arg.substr(prefix.size());
  if (value.empty()) {
    throw ConfigError(name + " requires a value");
  }
  return value;
}

}  // namespace

void LoadConfigFile(const std::string& path, AppConfig& config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("cannot open config file " + path);
  }

  json j;
  try {
    file >> j;
  } catch (const json::exception& e) {
    throw ConfigError("cannot parse config file " + path + ": " + e.what());
  }
  if (!j.is_object()) {
    throw ConfigError("config file " + path + " must contain a JSON object");
  }

  try {
    if (j.contains("listen_port")) {
      int port = j.at("listen_port").get<int>();
      if (port < 0 || port > 65535) {
        throw ConfigError("listen_port out of range: " + std::to_string(port));
      }
      config.listen_port = static_cast<uint16_t>(port);
    }
    if (j.contains("io_threads")) {
      config.server_config.io_threads = CheckThreads(j.at("io_threads").get<int>());
    }
    if (j.contains("close_on_sentinel")) {
      config.server_config.close_on_sentinel = j.at("close_on_sentinel").get<bool>();
    }
    if (j.contains("advertised_address")) {
      config.server_config.advertised_address = CheckAdvertised(j.at("advertised_address").get<std::string>());
    }
    if (j.contains("log_level")) {
      config.log_level = CheckLogLevel(j.at("log_level").get<std::string>());
    }
    if (j.contains("connect")) {
      for (const auto& peer : j.at("connect")) {
        config.connect.push_back(CheckPeer(peer.get<std::string>()));
      }
    }
  } catch (const json::exception& e) {
    throw ConfigError("invalid value in config file " + path + ": " + e.what());
  }
}

CommandLineAction ParseCommandLine(int argc, const char* const argv[], AppConfig& config) {
  std::vector<std::string> args(argv + 1, argv + argc);

  // Config file first so that flags win
  for (const auto& arg : args) {
    if (auto path = FlagValue(arg, "--conf")) {
      LoadConfigFile(*path, config);
    }
  }

  for (const auto& arg : args) {
    if (arg == "--help" || arg == "-h") {
      return CommandLineAction::ShowHelp;
    } else if (arg == "--version" || arg == "-v") {
      return CommandLineAction::ShowVersion;
    } else if (arg == "--legacy-sentinel") {
      config.server_config.close_on_sentinel = false;
    } else if (FlagValue(arg, "--conf")) {
      continue;
    } else if (auto port = FlagValue(arg, "--port")) {
      auto parsed = util::ParsePort(*port);
      if (!parsed) {
        throw ConfigError("invalid port '" + *port + "' (0-65535)");
      }
      config.listen_port = *parsed;
    } else if (auto peer = FlagValue(arg, "--connect")) {
      config.connect.push_back(CheckPeer(*peer));
    } else if (auto threads = FlagValue(arg, "--threads")) {
      config.server_config.io_threads = ParseThreads(*threads);
    } else if (auto level = FlagValue(arg, "--loglevel")) {
      config.log_level = CheckLogLevel(*level);
    } else if (auto path = FlagValue(arg, "--logfile")) {
      config.log_file = *path;
    } else if (auto address = FlagValue(arg, "--advertise")) {
      config.server_config.advertised_address = CheckAdvertised(*address);
    } else {
      throw ConfigError("unknown option '" + arg + "'");
    }
  }

  return CommandLineAction::Run;
}

void PrintUsage(const char* program_name) {
  std::cout << "peerlink - peer-to-peer text messaging over TCP\n\n"
            << "Usage: " << program_name << " [options]\n\n"
            << "Options:\n"
            << "  --port=<n>             Listen port (default: 0, OS-assigned)\n"
            << "  --connect=<host:port>  Connect to a peer at startup (repeatable)\n"
            << "  --threads=<n>          I/O threads (default: 2)\n"
            << "  --loglevel=<level>     trace, debug, info, warn, error, critical, off (default: info)\n"
            << "  --logfile=<path>       Also write the log to a file\n"
            << "  --advertise=<ip>       Address to advertise instead of probing\n"
            << "  --legacy-sentinel      On CLOSE only stop reading; keep the connection registered\n"
            << "  --conf=<file.json>     Load options from a JSON file (flags take precedence)\n"
            << "  --version              Show version information\n"
            << "  --help                 Show this help message\n\n"
            << "Console commands:\n"
            << "  <text>                 Broadcast text to all peers\n"
            << "  /send <host:port> <text>\n"
            << "  /connect <host:port>\n"
            << "  /close <host:port>\n"
            << "  /closeall\n"
            << "  /confirm <host:port>\n"
            << "  /peers\n"
            << "  /ifaces                List local interface addresses\n"
            << "  /whoami                Show the advertised address and listen port\n"
            << "  /help\n"
            << "  /quit\n"
            << std::endl;
}

}  // namespace app
}  // namespace peerlink
