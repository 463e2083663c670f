/**
 * libcurl transport that POSTs event batches to the collaboration endpoint.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <curl/curl.h>

#include "collab/config.hpp"
#include "collab/event.hpp"
#include "collab/logging.hpp"
#include "collab/transport.hpp"

namespace collab {

namespace detail {
  // Reference counter for curl_global_init
  // We never call curl_global_cleanup (only safe at program termination)
  inline std::atomic<int>& curl_init_ref_count() {
    static std::atomic<int> count{0};
    return count;
  }

  inline std::mutex& curl_init_mutex() {
    static std::mutex mtx;
    return mtx;
  }

  // Initialize curl once (thread-safe, idempotent)
  inline void ensure_curl_initialized() {
    std::lock_guard<std::mutex> lock(curl_init_mutex());
    if (curl_init_ref_count().fetch_add(1) == 0) {
      curl_global_init(CURL_GLOBAL_DEFAULT);
    }
  }

  // Keeps at most 512 bytes of the response body for diagnostics
  struct WriteData {
    std::string data;
  };

  inline size_t WriteCallback(void* contents, size_t size, size_t nmemb,
                              void* userp) {
    size_t total_size = size * nmemb;
    WriteData* write_data = static_cast<WriteData*>(userp);
    size_t room = write_data->data.size() < 512 ? 512 - write_data->data.size() : 0;
    write_data->data.append(static_cast<char*>(contents),
                            std::min(room, total_size));
    return total_size;
  }
}  // namespace detail

/**
 * HTTP transport for sending event batches.
 *
 * One libcurl easy handle is reused for every request, so connections to
 * the endpoint stay alive between batches. Network failures and retriable
 * status codes are retried with exponential backoff inside a single
 * send_batch() call. Nothing here throws.
 */
class HttpTransport : public Transport {
 public:
  inline explicit HttpTransport(const BridgeConfig& config);
  inline ~HttpTransport() override;

  // Non-copyable
  HttpTransport(const HttpTransport&) = delete;
  HttpTransport& operator=(const HttpTransport&) = delete;

  /**
   * POST the batch as {"events":[...]}.
   *
   * Total attempts are bounded by max_retries + 1. The returned status is
   * the classification of the last attempt.
   */
  inline SendResult send_batch(const std::vector<Event>& events) override;

  /**
   * Delay before retry number `retry` (1-based).
   *
   * A positive Retry-After value (seconds) replaces the exponential delay and
   * is capped at retry_after_max. The exponential delay is capped at
   * retry_backoff_max.
   */
  std::chrono::milliseconds retry_delay(int retry, long retry_after_seconds = 0) const {
    if (retry_after_seconds > 0) {
      if (retry_after_seconds >= retry_after_max_.count() / 1000 + 1) {
        return retry_after_max_;
      }
      return std::min(std::chrono::milliseconds(retry_after_seconds * 1000),
                      retry_after_max_);
    }
    if (base_backoff_.count() <= 0) {
      return std::chrono::milliseconds(0);
    }
    std::chrono::milliseconds delay = base_backoff_;
    for (int i = 1; i < retry && delay < backoff_max_; ++i) {
      delay *= 2;
    }
    return std::min(delay, backoff_max_);
  }

 private:
  std::string endpoint_;
  std::string user_agent_;
  int max_retries_;
  std::chrono::milliseconds base_backoff_;
  std::chrono::milliseconds backoff_max_;
  std::chrono::milliseconds retry_after_max_;
  std::chrono::milliseconds http_timeout_;
  std::set<long> retry_status_codes_;
  long max_connections_;
  std::shared_ptr<spdlog::logger> log_;

  CURL* curl_handle_ = nullptr;
  struct curl_slist* headers_ = nullptr;
  char error_buffer_[CURL_ERROR_SIZE] = {0};

  // Thread safety: protect curl_handle_ access
  std::mutex curl_mutex_;
  std::atomic<bool> shutdown_flag_{false};

  bool is_retriable_status(long code) const {
    return retry_status_codes_.count(code) > 0;
  }

  inline void prepare_request(const std::string& payload,
                              detail::WriteData* write_data);
};

inline HttpTransport::HttpTransport(const BridgeConfig& config)
    : endpoint_(config.api_url),
      user_agent_(config.user_agent),
      max_retries_(std::max(0, config.max_retries)),
      base_backoff_(config.retry_backoff),
      backoff_max_(config.retry_backoff_max),
      retry_after_max_(config.retry_after_max),
      http_timeout_(config.http_timeout),
      retry_status_codes_(config.retry_status_codes),
      max_connections_(static_cast<long>(std::max<size_t>(1, config.pool_maxsize))),
      log_(bridge_logger()) {
  // Ensure curl is initialized (thread-safe, idempotent)
  detail::ensure_curl_initialized();

  curl_handle_ = curl_easy_init();
  if (!curl_handle_) {
    log_->error("Failed to initialize libcurl for collaboration transport");
  }

  headers_ = curl_slist_append(headers_, "Content-Type: application/json");
  headers_ = curl_slist_append(headers_, ("X-API-Key: " + config.api_key).c_str());
  // Suppress "Expect: 100-continue" round trips on large batches
  headers_ = curl_slist_append(headers_, "Expect:");
}

inline HttpTransport::~HttpTransport() {
  // 1. Prevent new operations from starting
  shutdown_flag_.store(true);

  // 2. Block until any in-flight send_batch() releases the handle
  std::lock_guard<std::mutex> lock(curl_mutex_);

  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
    curl_handle_ = nullptr;
  }
  if (headers_) {
    curl_slist_free_all(headers_);
    headers_ = nullptr;
  }

  detail::curl_init_ref_count().fetch_sub(1);
}

inline void HttpTransport::prepare_request(const std::string& payload,
                                           detail::WriteData* write_data) {
  // curl_easy_reset keeps the connection cache, so keep-alive survives
  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, endpoint_.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POST, 1L);
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(payload.size()));
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers_);
  curl_easy_setopt(curl_handle_, CURLOPT_USERAGENT, user_agent_.c_str());

  curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT_MS,
                   static_cast<long>(http_timeout_.count()));
  curl_easy_setopt(curl_handle_, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl_handle_, CURLOPT_TCP_KEEPALIVE, 1L);
  curl_easy_setopt(curl_handle_, CURLOPT_MAXCONNECTS, max_connections_);
  curl_easy_setopt(curl_handle_, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl_handle_, CURLOPT_MAXREDIRS, 30L);

  error_buffer_[0] = '\0';
  curl_easy_setopt(curl_handle_, CURLOPT_ERRORBUFFER, error_buffer_);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, detail::WriteCallback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, write_data);
}

inline SendResult HttpTransport::send_batch(const std::vector<Event>& events) {
  // Fast path - avoids lock acquisition after shutdown
  if (shutdown_flag_.load()) {
    return SendResult::failure(SendStatus::CONNECTION_ERROR, 0, 0,
                               "transport shut down");
  }
  if (events.empty()) {
    return SendResult::success(0, 0);
  }

  const std::string payload = serialize_batch(events);

  std::lock_guard<std::mutex> lock(curl_mutex_);

  // Check again after acquiring lock (shutdown may have happened in between)
  if (shutdown_flag_.load() || !curl_handle_) {
    return SendResult::failure(SendStatus::CONNECTION_ERROR, 0, 0,
                               "libcurl handle unavailable");
  }

  detail::WriteData write_data;
  prepare_request(payload, &write_data);

  SendResult result;
  const int total_attempts = max_retries_ + 1;
  for (int attempt = 1; attempt <= total_attempts; ++attempt) {
    write_data.data.clear();
    long retry_after = 0;

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res == CURLE_OK) {
      long code = 0;
      curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &code);
      if (code < 400) {
        log_->debug("Sent batch of {} events (HTTP {}, attempt {})",
                    events.size(), code, attempt);
        return SendResult::success(code, attempt);
      }

      result = SendResult::failure(SendStatus::HTTP_ERROR, code, attempt,
                                   "HTTP " + std::to_string(code) + ": " +
                                       write_data.data);
      if (!is_retriable_status(code)) {
        return result;
      }
      if (code == 429 || code == 503) {
        curl_off_t header_value = 0;
        if (curl_easy_getinfo(curl_handle_, CURLINFO_RETRY_AFTER, &header_value) ==
                CURLE_OK &&
            header_value > 0) {
          retry_after = static_cast<long>(header_value);
        }
      }
    } else {
      SendStatus status = (res == CURLE_OPERATION_TIMEDOUT)
                              ? SendStatus::TIMEOUT
                              : SendStatus::CONNECTION_ERROR;
      std::string detail = curl_easy_strerror(res);
      if (error_buffer_[0] != '\0') {
        detail += ": ";
        detail += error_buffer_;
      }
      result = SendResult::failure(status, 0, attempt, detail);
    }

    if (attempt < total_attempts) {
      // Allow a shutting-down transport to give up between attempts
      if (shutdown_flag_.load()) {
        break;
      }
      std::chrono::milliseconds delay = retry_delay(attempt, retry_after);
      log_->debug("Attempt {}/{} failed ({}), retrying in {}ms", attempt,
                  total_attempts, result.detail, delay.count());
      std::this_thread::sleep_for(delay);
    }
  }

  return result;
}

}  // namespace collab
