// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace replichain {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the application.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use (replicas may be mined
 * on pool threads).
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Multiple calls are safe;
   * only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "replichain.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name ("chain", "merkle", "consensus", "app")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for a specific component
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);

  // Component names known to the log manager
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace replichain

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  replichain::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  replichain::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  replichain::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  replichain::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  replichain::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_CHAIN_TRACE(...)                                                   \
  replichain::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  replichain::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  replichain::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  replichain::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  replichain::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_MERKLE_TRACE(...)                                                  \
  replichain::util::LogManager::GetLogger("merkle")->trace(__VA_ARGS__)
#define LOG_MERKLE_DEBUG(...)                                                  \
  replichain::util::LogManager::GetLogger("merkle")->debug(__VA_ARGS__)

#define LOG_CONSENSUS_DEBUG(...)                                               \
  replichain::util::LogManager::GetLogger("consensus")->debug(__VA_ARGS__)
#define LOG_CONSENSUS_INFO(...)                                                \
  replichain::util::LogManager::GetLogger("consensus")->info(__VA_ARGS__)
#define LOG_CONSENSUS_WARN(...)                                                \
  replichain::util::LogManager::GetLogger("consensus")->warn(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  replichain::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  replichain::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  replichain::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
