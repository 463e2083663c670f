/**
 * spdlog sink that forwards log messages to an EventBridge as "log" events.
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/details/log_msg.h>
#include <spdlog/details/null_mutex.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>

#include "collab/event.hpp"
#include "collab/event_bridge.hpp"
#include "collab/logging.hpp"

namespace collab {

/**
 * spdlog sink adapter for the collaboration bridge.
 *
 * Every message becomes one event bound to a fixed operation (and optional
 * session/user). Messages logged by the bridge's own "collab_bridge" logger
 * are ignored, so the sink may share sinks with bridge diagnostics.
 */
template <typename Mutex>
class EventBridgeSink : public spdlog::sinks::base_sink<Mutex> {
 public:
  EventBridgeSink(std::shared_ptr<EventBridge> bridge, std::string operation_id,
                  std::optional<std::string> session_id = std::nullopt,
                  std::optional<std::string> user_id = std::nullopt,
                  std::string event_type = "log")
      : bridge_(std::move(bridge)),
        operation_id_(std::move(operation_id)),
        session_id_(std::move(session_id)),
        user_id_(std::move(user_id)),
        event_type_(std::move(event_type)) {}

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    if (!bridge_ || !bridge_->is_enabled()) {
      return;
    }

    std::string logger_name(msg.logger_name.data(), msg.logger_name.size());
    if (logger_name == kBridgeLoggerName) {
      return;
    }

    bridge_->emit(event_type_, std::string(msg.payload.data(), msg.payload.size()),
                  operation_id_, session_id_, user_id_, convert_metadata(msg));
  }

  // Delivery is driven by the bridge dispatcher
  void flush_() override {}

  /**
   * Build event metadata from a log message.
   * Protected for testing purposes.
   */
  Metadata convert_metadata(const spdlog::details::log_msg& msg) const {
    Metadata metadata;
    auto level = spdlog::level::to_string_view(msg.level);
    metadata.emplace("level", std::string(level.data(), level.size()));
    metadata.emplace("logger",
                     std::string(msg.logger_name.data(), msg.logger_name.size()));
    if (msg.source.filename) {
      metadata.emplace("file", std::string(msg.source.filename));
      metadata.emplace("line", msg.source.line);
    }
    return metadata;
  }

 private:
  std::shared_ptr<EventBridge> bridge_;
  std::string operation_id_;
  std::optional<std::string> session_id_;
  std::optional<std::string> user_id_;
  std::string event_type_;
};

// Convenience type aliases
using EventBridgeSink_mt = EventBridgeSink<std::mutex>;
using EventBridgeSink_st = EventBridgeSink<spdlog::details::null_mutex>;

/**
 * Add an EventBridgeSink to an existing logger (existing sinks are kept).
 * Does nothing when the bridge is missing or disabled.
 */
inline void setup_event_bridge(const std::shared_ptr<spdlog::logger>& logger,
                               std::shared_ptr<EventBridge> bridge,
                               const std::string& operation_id) {
  if (!logger || !bridge || !bridge->is_enabled()) {
    return;
  }
  logger->sinks().push_back(
      std::make_shared<EventBridgeSink_mt>(std::move(bridge), operation_id));
}

/**
 * Get the registered logger called logger_name, or create and register one
 * whose only sink forwards to the bridge.
 */
inline std::shared_ptr<spdlog::logger> create_event_bridge_logger(
    const std::string& logger_name, std::shared_ptr<EventBridge> bridge,
    const std::string& operation_id) {
  auto logger = spdlog::get(logger_name);
  if (logger) {
    return logger;
  }

  logger = std::make_shared<spdlog::logger>(logger_name);
  if (bridge && bridge->is_enabled()) {
    logger->sinks().push_back(
        std::make_shared<EventBridgeSink_mt>(std::move(bridge), operation_id));
  }
  spdlog::register_logger(logger);
  return logger;
}

}  // namespace collab
