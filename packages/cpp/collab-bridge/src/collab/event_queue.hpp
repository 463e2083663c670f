/**
 * Bounded multi-producer / single-consumer event queue.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "collab/event.hpp"
#include "collab/logging.hpp"

namespace collab {

/**
 * Thread-safe FIFO with fixed capacity and an overflow counter.
 *
 * put() never blocks longer than its timeout. When the queue stays full the
 * new event is discarded (never queued for later) and dropped_count()
 * increments.
 */
class EventQueue {
 public:
  explicit EventQueue(size_t capacity = 1000)
      : capacity_(capacity), log_(bridge_logger()) {
    if (capacity_ == 0) {
      log_->warn("Event queue capacity 0 is not usable, using 1");
      capacity_ = 1;
    }
  }

  // Non-copyable
  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  /**
   * Insert an event, waiting up to timeout for free space.
   *
   * @return true if queued, false if the event was dropped
   */
  bool put(Event event,
           std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      bool has_space = not_full_.wait_for(
          lock, timeout, [this] { return events_.size() < capacity_; });
      if (has_space) {
        events_.push_back(std::move(event));
        lock.unlock();
        not_empty_.notify_one();
        return true;
      }
      ++dropped_;
    }
    log_->warn("Event queue full, dropping event {}", event.id());
    return false;
  }

  /**
   * Remove the oldest event, waiting up to timeout for one to arrive.
   */
  std::optional<Event> get(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
      return std::nullopt;
    }
    return pop_front_locked(lock);
  }

  /**
   * Remove the oldest event without waiting.
   */
  std::optional<Event> try_get() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (events_.empty()) {
      return std::nullopt;
    }
    return pop_front_locked(lock);
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
  }

  std::uint64_t dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

  size_t capacity() const { return capacity_; }

 private:
  std::optional<Event> pop_front_locked(std::unique_lock<std::mutex>& lock) {
    std::optional<Event> event(std::move(events_.front()));
    events_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return event;
  }

  size_t capacity_;
  std::shared_ptr<spdlog::logger> log_;

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<Event> events_;
  std::uint64_t dropped_ = 0;
};

}  // namespace collab
