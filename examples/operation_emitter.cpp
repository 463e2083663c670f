/**
 * Example producer using the collaboration bridge direct API.
 *
 * Simulates one operation that runs a tool and streams its output lines to
 * the collaboration server.
 *
 * Configure with:
 *   COLLAB_API_URL=http://localhost:8081/api/events
 *   COLLAB_API_KEY=<key>
 */

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "collab_bridge.hpp"

int main() {
  collab::BridgeConfig config = collab::BridgeConfig::from_env();

  std::cout << "Collaboration bridge example (direct API)" << std::endl;
  std::cout << "API URL: " << config.api_url << std::endl;
  std::cout << "Active: " << (config.is_active() ? "true" : "false") << std::endl;

  collab::EventBridge bridge(config);

  const std::string operation_id = "OP_EXAMPLE_001";
  bridge.emit("operation_start", "Assessment started", operation_id, "session-1",
              "operator-1", {{"target", "scanme.example"}, {"max_steps", 25}});
  bridge.emit("tool_start", "nmap -sV scanme.example", operation_id, "session-1",
              std::nullopt, {{"tool", "nmap"}});

  for (int i = 0; i < 25; ++i) {
    bridge.emit("stdout", "PORT " + std::to_string(20 + i) + "/tcp open",
                operation_id, "session-1");
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  bridge.emit("tool_end", "nmap finished", operation_id, "session-1", std::nullopt,
              {{"tool", "nmap"}, {"exit_code", 0}, {"duration_s", 0.5}});

  // Flushes whatever is still batched
  bridge.stop();

  collab::BridgeStats stats = bridge.stats();
  std::cout << "state=" << collab::to_string(stats.state)
            << " sent=" << stats.events_sent << " failed=" << stats.events_failed
            << " dropped=" << stats.dropped_events
            << " batches=" << stats.batches_sent << std::endl;
  return 0;
}
