// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace peerlink {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and access to the
 * per-component loggers ("default", "network", "app").
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Only the first call performs initialization.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "peerlink.log");

  // Flush and drop all loggers. Subsequent logging calls auto-reinitialize.
  static void Shutdown();

  // Get logger for a component. Unknown names return the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a specific component (network, app, default).
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace peerlink

// Convenience macros for logging
#define LOG_TRACE(...) peerlink::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) peerlink::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) peerlink::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) peerlink::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) peerlink::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...) peerlink::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) peerlink::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) peerlink::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) peerlink::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) peerlink::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...) peerlink::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...) peerlink::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...) peerlink::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...) peerlink::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// Use these for messages a remote peer can trigger at will (malformed frames,
// accept errors, write failures). The first argument names who triggered the
// message (peer address, "listener"); each callsite allows 20 lines per minute
// per subject.

#include "util/rate_limiter.hpp"

// Helper macro to generate callsite key from file:line
#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_NET_RL_(lvl, subject, ...)                                                                                 \
  do {                                                                                                                 \
    const std::string rl_subject_ = (subject);                                                                         \
    auto rl_verdict_ = peerlink::util::RateLimiter::instance().check(CALLSITE_KEY_, rl_subject_);                      \
    if (rl_verdict_.log) {                                                                                             \
      auto rl_logger_ = peerlink::util::LogManager::GetLogger("network");                                              \
      if (rl_verdict_.suppressed > 0) {                                                                                \
        rl_logger_->lvl("{} similar messages about {} were suppressed", rl_verdict_.suppressed, rl_subject_);          \
      }                                                                                                                \
      rl_logger_->lvl(__VA_ARGS__);                                                                                    \
    }                                                                                                                  \
  } while (0)

#define LOG_NET_WARN_RL(subject, ...) LOG_NET_RL_(warn, subject, __VA_ARGS__)
#define LOG_NET_ERROR_RL(subject, ...) LOG_NET_RL_(error, subject, __VA_ARGS__)
