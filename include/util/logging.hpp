// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace tangle {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the client library and the CLI.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Thread-safe: Uses std::call_once internally. Multiple calls are safe;
  // only the first call performs initialization.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "tangle.log");

  // Shutdown logging system (flushes buffers).
  // Subsequent logging calls after shutdown will auto-reinitialize.
  static void Shutdown();

  // Get logger for specific component (network, pool, pow, wallet, client).
  // Unknown components get the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a single component.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace tangle

// Convenience macros for logging
#define LOG_TRACE(...) tangle::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) tangle::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) tangle::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) tangle::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) tangle::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...) tangle::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) tangle::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) tangle::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) tangle::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) tangle::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_POOL_TRACE(...) tangle::util::LogManager::GetLogger("pool")->trace(__VA_ARGS__)
#define LOG_POOL_DEBUG(...) tangle::util::LogManager::GetLogger("pool")->debug(__VA_ARGS__)
#define LOG_POOL_INFO(...) tangle::util::LogManager::GetLogger("pool")->info(__VA_ARGS__)
#define LOG_POOL_WARN(...) tangle::util::LogManager::GetLogger("pool")->warn(__VA_ARGS__)
#define LOG_POOL_ERROR(...) tangle::util::LogManager::GetLogger("pool")->error(__VA_ARGS__)

#define LOG_POW_DEBUG(...) tangle::util::LogManager::GetLogger("pow")->debug(__VA_ARGS__)
#define LOG_POW_INFO(...) tangle::util::LogManager::GetLogger("pow")->info(__VA_ARGS__)
#define LOG_POW_ERROR(...) tangle::util::LogManager::GetLogger("pow")->error(__VA_ARGS__)

#define LOG_WALLET_TRACE(...) tangle::util::LogManager::GetLogger("wallet")->trace(__VA_ARGS__)
#define LOG_WALLET_DEBUG(...) tangle::util::LogManager::GetLogger("wallet")->debug(__VA_ARGS__)
#define LOG_WALLET_INFO(...) tangle::util::LogManager::GetLogger("wallet")->info(__VA_ARGS__)

#define LOG_CLIENT_TRACE(...) tangle::util::LogManager::GetLogger("client")->trace(__VA_ARGS__)
#define LOG_CLIENT_DEBUG(...) tangle::util::LogManager::GetLogger("client")->debug(__VA_ARGS__)
#define LOG_CLIENT_INFO(...) tangle::util::LogManager::GetLogger("client")->info(__VA_ARGS__)
#define LOG_CLIENT_WARN(...) tangle::util::LogManager::GetLogger("client")->warn(__VA_ARGS__)
#define LOG_CLIENT_ERROR(...) tangle::util::LogManager::GetLogger("client")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// Limits log frequency per callsite. Use these for messages driven by remote
// nodes (failed health probes, malformed responses) which repeat on every
// sync cycle while a node stays down.
//
// Rate limits (token bucket): 200 messages per hour per callsite.

#include "util/rate_limiter.hpp"

// Helper macro to generate callsite key from file:line
#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_WARN_RL(...)                                                                                               \
  do {                                                                                                                 \
    if (tangle::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                  \
      tangle::util::LogManager::GetLogger()->warn(__VA_ARGS__);                                                        \
    }                                                                                                                  \
  } while (0)

#define LOG_NET_WARN_RL(...)                                                                                           \
  do {                                                                                                                 \
    if (tangle::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                  \
      tangle::util::LogManager::GetLogger("network")->warn(__VA_ARGS__);                                               \
    }                                                                                                                  \
  } while (0)

#define LOG_POOL_DEBUG_RL(...)                                                                                         \
  do {                                                                                                                 \
    if (tangle::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                  \
      tangle::util::LogManager::GetLogger("pool")->debug(__VA_ARGS__);                                                 \
    }                                                                                                                  \
  } while (0)

#define LOG_POOL_WARN_RL(...)                                                                                          \
  do {                                                                                                                 \
    if (tangle::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                  \
      tangle::util::LogManager::GetLogger("pool")->warn(__VA_ARGS__);                                                  \
    }                                                                                                                  \
  } while (0)
