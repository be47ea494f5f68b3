// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace svcnet {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the application.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Multiple calls are safe;
   * only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "svcnet.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (graph, orchestrator, docker, app, default)
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
   * @param component Component name (graph, orchestrator, docker, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical, off)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace svcnet

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  svcnet::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  svcnet::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  svcnet::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  svcnet::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  svcnet::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_GRAPH_TRACE(...)                                                   \
  svcnet::util::LogManager::GetLogger("graph")->trace(__VA_ARGS__)
#define LOG_GRAPH_DEBUG(...)                                                   \
  svcnet::util::LogManager::GetLogger("graph")->debug(__VA_ARGS__)
#define LOG_GRAPH_WARN(...)                                                    \
  svcnet::util::LogManager::GetLogger("graph")->warn(__VA_ARGS__)

#define LOG_ORCH_TRACE(...)                                                    \
  svcnet::util::LogManager::GetLogger("orchestrator")->trace(__VA_ARGS__)
#define LOG_ORCH_DEBUG(...)                                                    \
  svcnet::util::LogManager::GetLogger("orchestrator")->debug(__VA_ARGS__)
#define LOG_ORCH_INFO(...)                                                     \
  svcnet::util::LogManager::GetLogger("orchestrator")->info(__VA_ARGS__)
#define LOG_ORCH_WARN(...)                                                     \
  svcnet::util::LogManager::GetLogger("orchestrator")->warn(__VA_ARGS__)
#define LOG_ORCH_ERROR(...)                                                    \
  svcnet::util::LogManager::GetLogger("orchestrator")->error(__VA_ARGS__)

#define LOG_DOCKER_TRACE(...)                                                  \
  svcnet::util::LogManager::GetLogger("docker")->trace(__VA_ARGS__)
#define LOG_DOCKER_DEBUG(...)                                                  \
  svcnet::util::LogManager::GetLogger("docker")->debug(__VA_ARGS__)
#define LOG_DOCKER_WARN(...)                                                   \
  svcnet::util::LogManager::GetLogger("docker")->warn(__VA_ARGS__)
#define LOG_DOCKER_ERROR(...)                                                  \
  svcnet::util::LogManager::GetLogger("docker")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  svcnet::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  svcnet::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  svcnet::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
