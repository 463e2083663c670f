/**
 * Configuration record for the collaboration event bridge.
 */

#pragma once

#include <cctype>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <regex>
#include <set>
#include <string>

#include "collab/logging.hpp"

namespace collab {

/**
 * Resolved settings for one EventBridge.
 *
 * The bridge only runs when enabled is true AND api_key is non-empty;
 * otherwise it is constructed in the DISABLED state and never touches the
 * network.
 */
struct BridgeConfig {
  std::string api_url = "http://localhost:8081/api/events";
  std::string api_key;
  bool enabled = true;

  /**
   * Start the dispatcher thread from the EventBridge constructor.
   * Default: true
   */
  bool auto_start = true;

  // Batching
  size_t batch_size = 10;
  std::chrono::milliseconds batch_timeout{500};
  std::chrono::milliseconds poll_interval{100};  // dispatcher queue wait

  /**
   * Maximum number of queued events.
   * When the queue is full, newly emitted events are dropped and counted.
   * Default: 1000
   */
  size_t queue_capacity = 1000;

  /**
   * How long emit() may wait for queue space before dropping the event.
   * Default: 100ms
   */
  std::chrono::milliseconds enqueue_timeout{100};

  /**
   * Maximum retries per request (total attempts = max_retries + 1).
   * Default: 3
   */
  int max_retries = 3;

  /**
   * Exponential backoff factor.
   * Delay before retry k = retry_backoff * 2^(k-1), capped at retry_backoff_max.
   * Default: 500ms
   */
  std::chrono::milliseconds retry_backoff{500};
  std::chrono::milliseconds retry_backoff_max{120000};

  /**
   * Upper bound on a server-requested Retry-After wait (429/503).
   * Keeps a throttling server from holding the dispatcher for minutes.
   * Default: 5000ms
   */
  std::chrono::milliseconds retry_after_max{5000};

  std::set<long> retry_status_codes{429, 500, 502, 503, 504};

  /**
   * HTTP request timeout.
   * Default: 5000 (5 seconds)
   */
  std::chrono::milliseconds http_timeout{5000};

  // Connection pool sizing (libcurl connection cache holds pool_maxsize)
  size_t pool_connections = 10;
  size_t pool_maxsize = 20;

  std::chrono::milliseconds stop_timeout{5000};
  std::string user_agent = "CollabEventBridge/1.0";

  bool is_active() const { return enabled && !api_key.empty(); }

  /**
   * Load configuration from environment variables, with fallback to config file.
   *
   * Endpoint and credential (highest to lowest priority):
   *   1. COLLAB_API_URL / COLLAB_API_KEY environment variables
   *   2. _collab/config.json (api_url/apiUrl, api_key/apiKey fields)
   *   3. Built-in defaults (no credential, so the bridge stays disabled)
   *
   * Optional:
   *   - COLLAB_ENABLED ("false", "0" or "no" disables)
   *   - COLLAB_BATCH_SIZE, COLLAB_BATCH_TIMEOUT_MS, COLLAB_QUEUE_CAPACITY
   *   - COLLAB_MAX_RETRIES, COLLAB_RETRY_BACKOFF_MS, COLLAB_HTTP_TIMEOUT_MS
   *
   * Invalid values are logged and ignored.
   */
  static BridgeConfig from_env();
};

namespace detail {

inline std::string to_lower(std::string value) {
  for (auto& c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return value;
}

/**
 * Read a string field from a JSON config file.
 *
 * Accepts the snake_case key or its camelCase alias. Returns an empty string
 * if the file doesn't exist or neither key is present.
 */
inline std::string read_config_field(const std::string& config_path,
                                     const std::string& key,
                                     const std::string& camel_key) {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    return "";
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  std::regex pattern("\"(?:" + key + "|" + camel_key +
                     ")\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch match;
  if (std::regex_search(content, match, pattern)) {
    return match[1].str();
  }
  return "";
}

/**
 * Parse an integer environment variable into [min_value, LONG_MAX].
 * Returns false (and logs) when the variable is set but invalid.
 */
inline bool parse_env_long(const char* name, long min_value, long* out) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return false;
  }

  errno = 0;
  char* end = nullptr;
  long value = std::strtol(raw, &end, 10);
  if (end == raw || *end != '\0' || errno == ERANGE || value < min_value) {
    bridge_logger()->warn("Ignoring invalid {}='{}' (expected integer >= {})",
                          name, raw, min_value);
    return false;
  }
  *out = value;
  return true;
}

}  // namespace detail

inline BridgeConfig BridgeConfig::from_env() {
  BridgeConfig config;
  const std::string config_path = "_collab/config.json";

  const char* api_url = std::getenv("COLLAB_API_URL");
  if (api_url && api_url[0] != '\0') {
    config.api_url = api_url;
  } else {
    std::string from_file =
        detail::read_config_field(config_path, "api_url", "apiUrl");
    if (!from_file.empty()) {
      config.api_url = from_file;
    }
  }

  const char* api_key = std::getenv("COLLAB_API_KEY");
  if (api_key && api_key[0] != '\0') {
    config.api_key = api_key;
  } else {
    config.api_key = detail::read_config_field(config_path, "api_key", "apiKey");
  }

  const char* enabled = std::getenv("COLLAB_ENABLED");
  if (enabled) {
    std::string value = detail::to_lower(enabled);
    if (value == "false" || value == "0" || value == "no") {
      config.enabled = false;
    }
  }

  long value = 0;
  if (detail::parse_env_long("COLLAB_BATCH_SIZE", 1, &value)) {
    config.batch_size = static_cast<size_t>(value);
  }
  if (detail::parse_env_long("COLLAB_BATCH_TIMEOUT_MS", 1, &value)) {
    config.batch_timeout = std::chrono::milliseconds(value);
  }
  if (detail::parse_env_long("COLLAB_QUEUE_CAPACITY", 1, &value)) {
    config.queue_capacity = static_cast<size_t>(value);
  }
  if (detail::parse_env_long("COLLAB_MAX_RETRIES", 0, &value)) {
    if (value <= INT_MAX) {
      config.max_retries = static_cast<int>(value);
    }
  }
  if (detail::parse_env_long("COLLAB_RETRY_BACKOFF_MS", 0, &value)) {
    config.retry_backoff = std::chrono::milliseconds(value);
  }
  if (detail::parse_env_long("COLLAB_HTTP_TIMEOUT_MS", 1, &value)) {
    config.http_timeout = std::chrono::milliseconds(value);
  }

  return config;
}

}  // namespace collab
