/**
 * Example using the spdlog adapter: application log lines are forwarded to
 * the collaboration server through the process-wide bridge.
 *
 * Configure with:
 *   COLLAB_ENABLED=true
 *   COLLAB_API_KEY=<key>
 */

#include <iostream>
#include <memory>

#include <spdlog/spdlog.h>

#include "collab_bridge.hpp"

int main() {
  // Stops the process-wide bridge (and flushes it) when main returns
  collab::GlobalBridgeGuard bridge_guard;

  std::shared_ptr<collab::EventBridge> bridge = collab::global_bridge();
  if (!bridge) {
    std::cout << "Collaboration disabled; set COLLAB_ENABLED=true" << std::endl;
    return 0;
  }

  auto logger = collab::create_event_bridge_logger("agent", bridge, "OP_EXAMPLE_002");
  logger->set_level(spdlog::level::info);

  logger->info("Agent started");
  logger->warn("Tool {} exceeded soft timeout", "sqlmap");
  logger->error("Step {} failed", 7);

  collab::emit_collaboration_event("operation_end", "Assessment finished",
                                   "OP_EXAMPLE_002");

  std::cout << "queued=" << bridge->stats().queue_size << std::endl;
  return 0;
}
