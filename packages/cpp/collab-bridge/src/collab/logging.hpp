/**
 * Diagnostic logger for the collaboration event bridge.
 *
 * Every bridge component reports through one registered spdlog logger named
 * "collab_bridge". Hosts may install their own logger under that name.
 */

#pragma once

#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace collab {

inline constexpr const char* kBridgeLoggerName = "collab_bridge";

namespace detail {
  inline std::mutex& logger_mutex() {
    static std::mutex mtx;
    return mtx;
  }
}  // namespace detail

/**
 * Get the bridge logger, creating it on first use.
 *
 * The default logger writes to stderr. Its level is read from
 * COLLAB_LOG_LEVEL (spdlog level names: trace, debug, info, warn, err,
 * critical, off) and defaults to info.
 */
inline std::shared_ptr<spdlog::logger> bridge_logger() {
  auto logger = spdlog::get(kBridgeLoggerName);
  if (logger) {
    return logger;
  }

  std::lock_guard<std::mutex> lock(detail::logger_mutex());
  logger = spdlog::get(kBridgeLoggerName);
  if (logger) {
    return logger;
  }

  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  logger = std::make_shared<spdlog::logger>(kBridgeLoggerName, sink);
  logger->set_level(spdlog::level::info);

  const char* level = std::getenv("COLLAB_LOG_LEVEL");
  if (level && level[0] != '\0') {
    // from_str() maps unknown names to off; only accept a real match
    auto parsed = spdlog::level::from_str(level);
    if (parsed != spdlog::level::off || std::string(level) == "off") {
      logger->set_level(parsed);
    }
  }

  spdlog::register_logger(logger);
  return logger;
}

/**
 * Replace the bridge logger (e.g. to route diagnostics into the host's sinks).
 *
 * Components capture the logger when they are constructed, so call this
 * before creating bridges.
 */
inline void set_bridge_logger(std::shared_ptr<spdlog::logger> logger) {
  if (!logger) {
    return;
  }
  std::lock_guard<std::mutex> lock(detail::logger_mutex());
  spdlog::drop(kBridgeLoggerName);
  if (logger->name() != kBridgeLoggerName) {
    logger = logger->clone(kBridgeLoggerName);
  }
  spdlog::register_logger(logger);
}

}  // namespace collab
