/**
 * Collaboration event bridge: queue, batching dispatcher and lifecycle.
 *
 * Producers call emit() from any thread. A single dispatcher thread drains
 * the queue into batches and hands each batch to the transport, one request
 * at a time. Failed batches are counted and dropped, never re-queued.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "collab/config.hpp"
#include "collab/event.hpp"
#include "collab/event_queue.hpp"
#include "collab/http_transport.hpp"
#include "collab/logging.hpp"
#include "collab/transport.hpp"

namespace collab {

enum class BridgeState {
  DISABLED = 0,
  STOPPED = 1,
  RUNNING = 2,
  STOPPING = 3
};

inline const char* to_string(BridgeState state) {
  switch (state) {
    case BridgeState::DISABLED:
      return "disabled";
    case BridgeState::STOPPED:
      return "stopped";
    case BridgeState::RUNNING:
      return "running";
    case BridgeState::STOPPING:
      return "stopping";
  }
  return "unknown";
}

/**
 * Point-in-time copy of the bridge counters.
 */
struct BridgeStats {
  std::uint64_t events_sent = 0;
  std::uint64_t events_failed = 0;
  std::uint64_t batches_sent = 0;
  std::uint64_t batches_failed = 0;
  std::uint64_t connection_errors = 0;
  std::uint64_t timeouts = 0;
  std::uint64_t http_errors = 0;

  // Read live from the queue
  size_t queue_size = 0;
  std::uint64_t dropped_events = 0;

  bool enabled = false;
  BridgeState state = BridgeState::DISABLED;
};

class EventBridge {
 public:
  /**
   * Create a bridge.
   *
   * When the config is not active (disabled, or no API key) the bridge is
   * DISABLED: emit() returns false and no transport is ever used. Otherwise
   * an HttpTransport is created unless one is supplied, and the dispatcher
   * starts if config.auto_start is set.
   */
  inline explicit EventBridge(BridgeConfig config,
                              std::unique_ptr<Transport> transport = nullptr);

  /**
   * Stops the dispatcher (flushing pending events) and always joins it.
   */
  inline ~EventBridge();

  // Non-copyable
  EventBridge(const EventBridge&) = delete;
  EventBridge& operator=(const EventBridge&) = delete;

  /**
   * Queue an event for delivery (thread-safe).
   *
   * Waits at most config.enqueue_timeout for queue space.
   *
   * @return true if queued; false if disabled or the queue was full
   */
  inline bool emit(std::string type, std::string content,
                   std::string operation_id,
                   std::optional<std::string> session_id = std::nullopt,
                   std::optional<std::string> user_id = std::nullopt,
                   Metadata metadata = {});

  /**
   * Launch the dispatcher thread. No effect if disabled or already running.
   */
  inline void start();

  /**
   * Signal the dispatcher to stop and wait up to timeout for it to flush
   * and exit. No effect if no dispatcher is running. An in-flight request
   * is never aborted; if it outlasts the timeout the bridge stays STOPPING.
   */
  inline void stop(std::chrono::milliseconds timeout);
  void stop() { stop(config_.stop_timeout); }

  inline BridgeStats stats() const;

  BridgeState state() const { return state_.load(); }
  bool is_enabled() const { return state() != BridgeState::DISABLED; }
  const BridgeConfig& config() const { return config_; }

 private:
  inline void dispatch_loop();
  inline void flush_batch(std::vector<Event>& batch);

  BridgeConfig config_;
  std::shared_ptr<spdlog::logger> log_;
  EventQueue queue_;
  std::unique_ptr<Transport> transport_;
  std::atomic<BridgeState> state_;

  // Dispatcher thread management
  std::thread worker_;
  std::mutex lifecycle_mutex_;
  std::condition_variable worker_done_cv_;
  bool worker_done_ = true;
  std::atomic<bool> stop_requested_{false};

  // Written by the dispatcher only
  std::atomic<std::uint64_t> events_sent_{0};
  std::atomic<std::uint64_t> events_failed_{0};
  std::atomic<std::uint64_t> batches_sent_{0};
  std::atomic<std::uint64_t> batches_failed_{0};
  std::atomic<std::uint64_t> connection_errors_{0};
  std::atomic<std::uint64_t> timeouts_{0};
  std::atomic<std::uint64_t> http_errors_{0};
};

inline EventBridge::EventBridge(BridgeConfig config,
                                std::unique_ptr<Transport> transport)
    : config_(std::move(config)),
      log_(bridge_logger()),
      queue_(config_.queue_capacity),
      transport_(std::move(transport)),
      state_(config_.is_active() ? BridgeState::STOPPED : BridgeState::DISABLED) {
  if (state_ == BridgeState::DISABLED) {
    log_->info("Collaboration event bridge disabled (no API key or disabled)");
    return;
  }

  if (!transport_) {
    transport_ = std::make_unique<HttpTransport>(config_);
  }
  log_->info("Collaboration event bridge initialized, API: {}", config_.api_url);

  if (config_.auto_start) {
    start();
  }
}

inline EventBridge::~EventBridge() {
  stop(config_.stop_timeout);

  // Never detach: the dispatcher uses this object until it returns
  std::unique_lock<std::mutex> lock(lifecycle_mutex_);
  if (worker_.joinable()) {
    stop_requested_.store(true);
    lock.unlock();
    worker_.join();
    state_.store(BridgeState::STOPPED);
  }
}

inline bool EventBridge::emit(std::string type, std::string content,
                              std::string operation_id,
                              std::optional<std::string> session_id,
                              std::optional<std::string> user_id,
                              Metadata metadata) {
  if (state() == BridgeState::DISABLED) {
    return false;
  }

  return queue_.put(Event::create(std::move(type), std::move(content),
                                  std::move(operation_id), std::move(session_id),
                                  std::move(user_id), std::move(metadata)),
                    config_.enqueue_timeout);
}

inline void EventBridge::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (state_ == BridgeState::DISABLED) {
    return;
  }
  if (worker_.joinable()) {
    if (!worker_done_) {
      return;  // dispatcher still alive
    }
    worker_.join();
  }

  stop_requested_.store(false);
  worker_done_ = false;
  state_.store(BridgeState::RUNNING);
  worker_ = std::thread([this]() { dispatch_loop(); });
  log_->info("Event bridge worker started");
}

inline void EventBridge::stop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(lifecycle_mutex_);
  if (!worker_.joinable()) {
    return;
  }

  if (state_ == BridgeState::RUNNING) {
    log_->info("Stopping event bridge worker...");
    state_.store(BridgeState::STOPPING);
  }
  stop_requested_.store(true);

  // The dispatcher performs the final flush before it reports done
  if (!worker_done_cv_.wait_for(lock, timeout, [this] { return worker_done_; })) {
    log_->warn("Event bridge worker did not stop within {}ms", timeout.count());
    return;
  }

  // A concurrent stop() may already have joined
  if (!worker_.joinable()) {
    return;
  }
  worker_.join();
  state_.store(BridgeState::STOPPED);

  log_->info("Event bridge worker stopped (sent={}, failed={}, dropped={})",
             events_sent_.load(), events_failed_.load(), queue_.dropped_count());
}

inline BridgeStats EventBridge::stats() const {
  BridgeStats stats;
  stats.events_sent = events_sent_.load();
  stats.events_failed = events_failed_.load();
  stats.batches_sent = batches_sent_.load();
  stats.batches_failed = batches_failed_.load();
  stats.connection_errors = connection_errors_.load();
  stats.timeouts = timeouts_.load();
  stats.http_errors = http_errors_.load();
  stats.queue_size = queue_.size();
  stats.dropped_events = queue_.dropped_count();
  stats.enabled = is_enabled();
  stats.state = state();
  return stats;
}

inline void EventBridge::dispatch_loop() {
  const size_t batch_size = std::max<size_t>(1, config_.batch_size);
  std::vector<Event> batch;
  batch.reserve(batch_size);
  auto last_flush = std::chrono::steady_clock::now();

  while (!stop_requested_.load()) {
    std::optional<Event> event = queue_.get(config_.poll_interval);
    if (event) {
      batch.push_back(std::move(*event));
    }

    // Size trigger bounds request volume, time trigger bounds latency
    if (!batch.empty() &&
        (batch.size() >= batch_size ||
         std::chrono::steady_clock::now() - last_flush >= config_.batch_timeout)) {
      flush_batch(batch);
      last_flush = std::chrono::steady_clock::now();
    }
  }

  // Final forced flush of what was queued when stop was seen. Events emitted
  // after this point stay queued for a later start().
  for (size_t pending = queue_.size(); pending > 0; --pending) {
    std::optional<Event> event = queue_.try_get();
    if (!event) {
      break;
    }
    batch.push_back(std::move(*event));
    if (batch.size() >= batch_size) {
      flush_batch(batch);
    }
  }
  flush_batch(batch);

  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    worker_done_ = true;
  }
  worker_done_cv_.notify_all();
}

inline void EventBridge::flush_batch(std::vector<Event>& batch) {
  if (batch.empty()) {
    return;
  }
  const size_t count = batch.size();

  SendResult result;
  bool threw = false;
  if (!transport_) {
    result = SendResult::failure(SendStatus::CONNECTION_ERROR, 0, 0,
                                 "no transport configured");
  } else {
    try {
      result = transport_->send_batch(batch);
    } catch (const std::exception& e) {
      log_->error("Unexpected error sending {} events: {}", count, e.what());
      threw = true;
    }
  }
  batch.clear();

  if (!threw && result.ok()) {
    batches_sent_.fetch_add(1);
    events_sent_.fetch_add(count);
    return;
  }

  batches_failed_.fetch_add(1);
  events_failed_.fetch_add(count);
  if (threw) {
    return;
  }

  switch (result.status) {
    case SendStatus::CONNECTION_ERROR:
      connection_errors_.fetch_add(1);
      log_->warn("Connection error sending {} events: {}", count, result.detail);
      break;
    case SendStatus::TIMEOUT:
      timeouts_.fetch_add(1);
      log_->warn("Timeout sending {} events after {} attempt(s): {}", count,
                 result.attempts, result.detail);
      break;
    case SendStatus::HTTP_ERROR:
      http_errors_.fetch_add(1);
      log_->error("HTTP error sending {} events after {} attempt(s): {}", count,
                  result.attempts, result.detail);
      break;
    case SendStatus::OK:
      break;
  }
}

}  // namespace collab
