// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#pragma once

#include <array>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace natforward {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the application.
 *
 * Thread-safety: All methods are thread-safe. Logger creation and
 * lookup are protected by a mutex.
 */
class LogManager {
public:
  // One logger per component; "default" backs the plain LOG_* macros
  static constexpr std::array<const char *, 5> COMPONENTS = {
      "default", "forwarding", "nat", "config", "app"};

  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Multiple calls are safe; only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "natforward.log");

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "forwarding", "nat", "config")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (forwarding, nat, config, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical, off)
   * @return false if the component is unknown or logging is not initialized
   */
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  static bool IsInitialized();

private:
  static bool initialized_;
};

} // namespace util
} // namespace natforward

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  natforward::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  natforward::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  natforward::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  natforward::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  natforward::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  natforward::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_FWD_TRACE(...)                                                     \
  natforward::util::LogManager::GetLogger("forwarding")->trace(__VA_ARGS__)
#define LOG_FWD_DEBUG(...)                                                     \
  natforward::util::LogManager::GetLogger("forwarding")->debug(__VA_ARGS__)
#define LOG_FWD_INFO(...)                                                      \
  natforward::util::LogManager::GetLogger("forwarding")->info(__VA_ARGS__)
#define LOG_FWD_WARN(...)                                                      \
  natforward::util::LogManager::GetLogger("forwarding")->warn(__VA_ARGS__)
#define LOG_FWD_ERROR(...)                                                     \
  natforward::util::LogManager::GetLogger("forwarding")->error(__VA_ARGS__)

#define LOG_NAT_TRACE(...)                                                     \
  natforward::util::LogManager::GetLogger("nat")->trace(__VA_ARGS__)
#define LOG_NAT_DEBUG(...)                                                     \
  natforward::util::LogManager::GetLogger("nat")->debug(__VA_ARGS__)
#define LOG_NAT_INFO(...)                                                      \
  natforward::util::LogManager::GetLogger("nat")->info(__VA_ARGS__)
#define LOG_NAT_WARN(...)                                                      \
  natforward::util::LogManager::GetLogger("nat")->warn(__VA_ARGS__)
#define LOG_NAT_ERROR(...)                                                     \
  natforward::util::LogManager::GetLogger("nat")->error(__VA_ARGS__)

#define LOG_CONFIG_TRACE(...)                                                  \
  natforward::util::LogManager::GetLogger("config")->trace(__VA_ARGS__)
#define LOG_CONFIG_DEBUG(...)                                                  \
  natforward::util::LogManager::GetLogger("config")->debug(__VA_ARGS__)
#define LOG_CONFIG_INFO(...)                                                   \
  natforward::util::LogManager::GetLogger("config")->info(__VA_ARGS__)
#define LOG_CONFIG_WARN(...)                                                   \
  natforward::util::LogManager::GetLogger("config")->warn(__VA_ARGS__)
#define LOG_CONFIG_ERROR(...)                                                  \
  natforward::util::LogManager::GetLogger("config")->error(__VA_ARGS__)
