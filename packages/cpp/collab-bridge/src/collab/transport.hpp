/**
 * Transport seam between the dispatcher and the network.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "collab/event.hpp"

namespace collab {

enum class SendStatus {
  OK = 0,
  CONNECTION_ERROR = 1,
  TIMEOUT = 2,
  HTTP_ERROR = 3
};

inline const char* to_string(SendStatus status) {
  switch (status) {
    case SendStatus::OK:
      return "ok";
    case SendStatus::CONNECTION_ERROR:
      return "connection_error";
    case SendStatus::TIMEOUT:
      return "timeout";
    case SendStatus::HTTP_ERROR:
      return "http_error";
  }
  return "unknown";
}

/**
 * Outcome of one send_batch() call, after any transport-level retries.
 */
struct SendResult {
  SendStatus status = SendStatus::OK;
  long http_status = 0;  // last HTTP status seen, 0 if no response
  int attempts = 0;
  std::string detail;

  bool ok() const { return status == SendStatus::OK; }

  static SendResult success(long http_status, int attempts) {
    return SendResult{SendStatus::OK, http_status, attempts, ""};
  }

  static SendResult failure(SendStatus status, long http_status, int attempts,
                            std::string detail) {
    return SendResult{status, http_status, attempts, std::move(detail)};
  }
};

/**
 * Delivers one batch as one request.
 *
 * Implementations report failures through SendResult and do not throw.
 * send_batch() is only called from the dispatcher thread.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  virtual SendResult send_batch(const std::vector<Event>& events) = 0;
};

}  // namespace collab
