// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace lightwallet {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component, all sharing the same sinks:
 *   default - anything without a more specific home
 *   wallet  - queries, transaction building, snapshots
 *   sync    - rollback / rollforward progress
 *   ledger  - ledger source implementations
 *
 * Initialization happens once (std::call_once); GetLogger() initializes
 * lazily with defaults, so library code can log before the host configured
 * anything.
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
                         const std::string &log_file_path = "wallet.log");

  // Flush and drop all loggers
  static void Shutdown();

  /**
   * Get logger for specific component
   * Unknown names resolve to the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for a single component
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);
};

} // namespace util
} // namespace lightwallet

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  lightwallet::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  lightwallet::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  lightwallet::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  lightwallet::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  lightwallet::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_WALLET_TRACE(...)                                                  \
  lightwallet::util::LogManager::GetLogger("wallet")->trace(__VA_ARGS__)
#define LOG_WALLET_DEBUG(...)                                                  \
  lightwallet::util::LogManager::GetLogger("wallet")->debug(__VA_ARGS__)
#define LOG_WALLET_INFO(...)                                                   \
  lightwallet::util::LogManager::GetLogger("wallet")->info(__VA_ARGS__)
#define LOG_WALLET_WARN(...)                                                   \
  lightwallet::util::LogManager::GetLogger("wallet")->warn(__VA_ARGS__)
#define LOG_WALLET_ERROR(...)                                                  \
  lightwallet::util::LogManager::GetLogger("wallet")->error(__VA_ARGS__)

#define LOG_SYNC_TRACE(...)                                                    \
  lightwallet::util::LogManager::GetLogger("sync")->trace(__VA_ARGS__)
#define LOG_SYNC_DEBUG(...)                                                    \
  lightwallet::util::LogManager::GetLogger("sync")->debug(__VA_ARGS__)
#define LOG_SYNC_INFO(...)                                                     \
  lightwallet::util::LogManager::GetLogger("sync")->info(__VA_ARGS__)
#define LOG_SYNC_WARN(...)                                                     \
  lightwallet::util::LogManager::GetLogger("sync")->warn(__VA_ARGS__)
#define LOG_SYNC_ERROR(...)                                                    \
  lightwallet::util::LogManager::GetLogger("sync")->error(__VA_ARGS__)

#define LOG_LEDGER_TRACE(...)                                                  \
  lightwallet::util::LogManager::GetLogger("ledger")->trace(__VA_ARGS__)
#define LOG_LEDGER_DEBUG(...)                                                  \
  lightwallet::util::LogManager::GetLogger("ledger")->debug(__VA_ARGS__)
#define LOG_LEDGER_WARN(...)                                                   \
  lightwallet::util::LogManager::GetLogger("ledger")->warn(__VA_ARGS__)
