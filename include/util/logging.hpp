// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace weave {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "chain", "recovery", "storage",
 * "peer", "crypto", "app"), all sharing the same sinks.
 *
 * Thread-safety: initialization runs exactly once (std::call_once); logger
 * map access is mutex protected.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  // Flush and drop all loggers
  static void Shutdown();

  /**
   * Get logger for a component. Auto-initializes with defaults.
   * Unknown component names fall back to the "default" logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level for all components
  static void SetLogLevel(const std::string &level);

  // Set log level for one component
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);
};

} // namespace util
} // namespace weave

#define LOG_TRACE(...) weave::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) weave::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) weave::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) weave::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) weave::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_CHAIN_TRACE(...)                                                   \
  weave::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  weave::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  weave::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  weave::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  weave::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_RECOVERY_TRACE(...)                                                \
  weave::util::LogManager::GetLogger("recovery")->trace(__VA_ARGS__)
#define LOG_RECOVERY_DEBUG(...)                                                \
  weave::util::LogManager::GetLogger("recovery")->debug(__VA_ARGS__)
#define LOG_RECOVERY_INFO(...)                                                 \
  weave::util::LogManager::GetLogger("recovery")->info(__VA_ARGS__)
#define LOG_RECOVERY_WARN(...)                                                 \
  weave::util::LogManager::GetLogger("recovery")->warn(__VA_ARGS__)
#define LOG_RECOVERY_ERROR(...)                                                \
  weave::util::LogManager::GetLogger("recovery")->error(__VA_ARGS__)

#define LOG_STORE_TRACE(...)                                                   \
  weave::util::LogManager::GetLogger("storage")->trace(__VA_ARGS__)
#define LOG_STORE_DEBUG(...)                                                   \
  weave::util::LogManager::GetLogger("storage")->debug(__VA_ARGS__)
#define LOG_STORE_INFO(...)                                                    \
  weave::util::LogManager::GetLogger("storage")->info(__VA_ARGS__)
#define LOG_STORE_WARN(...)                                                    \
  weave::util::LogManager::GetLogger("storage")->warn(__VA_ARGS__)
#define LOG_STORE_ERROR(...)                                                   \
  weave::util::LogManager::GetLogger("storage")->error(__VA_ARGS__)

#define LOG_PEER_TRACE(...)                                                    \
  weave::util::LogManager::GetLogger("peer")->trace(__VA_ARGS__)
#define LOG_PEER_DEBUG(...)                                                    \
  weave::util::LogManager::GetLogger("peer")->debug(__VA_ARGS__)
#define LOG_PEER_INFO(...)                                                     \
  weave::util::LogManager::GetLogger("peer")->info(__VA_ARGS__)
#define LOG_PEER_WARN(...)                                                     \
  weave::util::LogManager::GetLogger("peer")->warn(__VA_ARGS__)

#define LOG_CRYPTO_INFO(...)                                                   \
  weave::util::LogManager::GetLogger("crypto")->info(__VA_ARGS__)
#define LOG_CRYPTO_ERROR(...)                                                  \
  weave::util::LogManager::GetLogger("crypto")->error(__VA_ARGS__)
