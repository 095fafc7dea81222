// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app_config.hpp"
#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
  using namespace peerlink;

  // Own buffering for std::cin so the console loop can tell when a line is pending
  std::ios::sync_with_stdio(false);

  app::AppConfig config;
  try {
    switch (app::ParseCommandLine(argc, argv, config)) {
    case app::CommandLineAction::ShowHelp:
      app::PrintUsage(argv[0]);
      return 0;
    case app::CommandLineAction::ShowVersion:
      std::cout << GetFullVersionString() << std::endl;
      std::cout << GetCopyrightString() << std::endl;
      return 0;
    case app::CommandLineAction::Run:
      break;
    }
  } catch (const app::ConfigError& e) {
    std::cerr << "Error: " << e.what() << "\n"
              << "Try " << argv[0] << " --help\n";
    return 1;
  }

  try {
    util::LogManager::Initialize(config.log_level, !config.log_file.empty(),
                                 config.log_file.empty() ? "peerlink.log" : config.log_file);
    LOG_INFO("{} starting", GetFullVersionString());

    int rc = 0;
    {
      app::Application application(config, std::cout);
      if (application.start()) {
        application.run();
        application.stop();
      } else {
        rc = 1;
      }
    }

    util::LogManager::Shutdown();
    return rc;

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    util::LogManager::Shutdown();
    return 1;
  }
}
