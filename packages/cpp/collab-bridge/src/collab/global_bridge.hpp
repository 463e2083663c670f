/**
 * Process-wide convenience accessor for the collaboration bridge.
 *
 * Code that can hold an EventBridge directly should do so. This holder is
 * for producers that have no handle to pass around; the host owns teardown
 * through shutdown_global_bridge() or a GlobalBridgeGuard in main().
 */

#pragma once

#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "collab/config.hpp"
#include "collab/event.hpp"
#include "collab/event_bridge.hpp"

namespace collab {

namespace detail {
  inline std::mutex& global_bridge_mutex() {
    static std::mutex mtx;
    return mtx;
  }

  inline std::shared_ptr<EventBridge>& global_bridge_instance() {
    static std::shared_ptr<EventBridge> instance;
    return instance;
  }
}  // namespace detail

/**
 * True when COLLAB_ENABLED is "true", "1" or "yes" (case-insensitive).
 */
inline bool collaboration_enabled_from_env() {
  const char* value = std::getenv("COLLAB_ENABLED");
  if (!value) {
    return false;
  }
  std::string flag = detail::to_lower(value);
  return flag == "true" || flag == "1" || flag == "yes";
}

/**
 * Get or lazily create the process-wide bridge.
 *
 * Returns nullptr unless collaboration is enabled in the environment. A
 * bridge created without a credential is DISABLED.
 */
inline std::shared_ptr<EventBridge> global_bridge() {
  std::lock_guard<std::mutex> lock(detail::global_bridge_mutex());
  auto& instance = detail::global_bridge_instance();
  if (!instance && collaboration_enabled_from_env()) {
    instance = std::make_shared<EventBridge>(BridgeConfig::from_env());
  }
  return instance;
}

/**
 * Emit through the process-wide bridge. Returns false if there is none.
 */
inline bool emit_collaboration_event(std::string type, std::string content,
                                     std::string operation_id,
                                     std::optional<std::string> session_id = std::nullopt,
                                     std::optional<std::string> user_id = std::nullopt,
                                     Metadata metadata = {}) {
  std::shared_ptr<EventBridge> bridge = global_bridge();
  if (!bridge) {
    return false;
  }
  return bridge->emit(std::move(type), std::move(content), std::move(operation_id),
                      std::move(session_id), std::move(user_id),
                      std::move(metadata));
}

/**
 * Stop the process-wide bridge (flushing pending events) and release it.
 * Safe to call more than once.
 */
inline void shutdown_global_bridge() {
  std::lock_guard<std::mutex> lock(detail::global_bridge_mutex());
  auto& instance = detail::global_bridge_instance();
  if (instance) {
    instance->stop();
    instance.reset();
  }
}

/**
 * Calls shutdown_global_bridge() when it goes out of scope.
 *
 *   int main() {
 *     collab::GlobalBridgeGuard bridge_guard;
 *     ...
 *   }
 */
class GlobalBridgeGuard {
 public:
  GlobalBridgeGuard() = default;
  ~GlobalBridgeGuard() { shutdown_global_bridge(); }

  GlobalBridgeGuard(const GlobalBridgeGuard&) = delete;
  GlobalBridgeGuard& operator=(const GlobalBridgeGuard&) = delete;
};

}  // namespace collab
