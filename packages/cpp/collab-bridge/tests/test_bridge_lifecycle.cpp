/**
 * Lifecycle tests for EventBridge.
 *
 * Tests:
 * - Disabled bridge: emit() refuses, transport is never called
 * - auto_start and explicit start()
 * - start()/stop() idempotence and restart
 * - stop() timeout with a slow in-flight request
 * - Destruction always joins the dispatcher
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "collab_bridge.hpp"
#include "recording_transport.hpp"

namespace collab {
namespace testing {

class BridgeLifecycleTest : public ::testing::Test {
 protected:
  std::unique_ptr<Transport> transport() {
    return std::make_unique<RecordingTransport>(log_);
  }

  std::shared_ptr<TransportLog> log_ = std::make_shared<TransportLog>();
};

TEST_F(BridgeLifecycleTest, MissingKeyDisablesBridge) {
  BridgeConfig config = recording_config();
  config.api_key.clear();
  config.auto_start = true;
  EventBridge bridge(config, transport());

  EXPECT_EQ(bridge.state(), BridgeState::DISABLED);
  EXPECT_FALSE(bridge.is_enabled());
  EXPECT_FALSE(bridge.emit("stdout", "ignored", "OP_1"));

  bridge.start();
  EXPECT_EQ(bridge.state(), BridgeState::DISABLED);
  bridge.stop(std::chrono::milliseconds(100));

  BridgeStats stats = bridge.stats();
  EXPECT_FALSE(stats.enabled);
  EXPECT_EQ(stats.queue_size, 0u);
  EXPECT_EQ(stats.dropped_events, 0u);
  EXPECT_EQ(log_->batch_count(), 0u);
}

TEST_F(BridgeLifecycleTest, EnabledFlagFalseDisablesBridge) {
  BridgeConfig config = recording_config();
  config.enabled = false;
  EventBridge bridge(config, transport());

  EXPECT_EQ(bridge.state(), BridgeState::DISABLED);
  EXPECT_FALSE(bridge.emit("stdout", "ignored", "OP_1"));
  EXPECT_EQ(log_->batch_count(), 0u);
}

TEST_F(BridgeLifecycleTest, NewBridgeIsStoppedWithoutAutoStart) {
  EventBridge bridge(recording_config(), transport());

  EXPECT_EQ(bridge.state(), BridgeState::STOPPED);
  EXPECT_TRUE(bridge.is_enabled());
  // Events queue up even before the dispatcher runs
  EXPECT_TRUE(bridge.emit("stdout", "early", "OP_1"));
  EXPECT_EQ(bridge.stats().queue_size, 1u);
}

TEST_F(BridgeLifecycleTest, AutoStartRunsDispatcher) {
  BridgeConfig config = recording_config(1);
  config.auto_start = true;
  EventBridge bridge(config, transport());

  EXPECT_EQ(bridge.state(), BridgeState::RUNNING);
  EXPECT_TRUE(bridge.emit("stdout", "line", "OP_1"));
  EXPECT_TRUE(wait_until([this] { return log_->batch_count() == 1; }));
}

TEST_F(BridgeLifecycleTest, StartTwiceKeepsOneDispatcher) {
  EventBridge bridge(recording_config(1), transport());
  bridge.start();
  bridge.start();
  EXPECT_EQ(bridge.state(), BridgeState::RUNNING);

  for (int i = 0; i < 10; ++i) {
    bridge.emit("stdout", "line " + std::to_string(i), "OP_1");
  }
  bridge.stop(std::chrono::seconds(5));

  std::lock_guard<std::mutex> lock(log_->mutex);
  std::set<std::thread::id> threads(log_->caller_threads.begin(),
                                    log_->caller_threads.end());
  EXPECT_EQ(log_->caller_threads.size(), 10u);
  EXPECT_EQ(threads.size(), 1u);
}

TEST_F(BridgeLifecycleTest, StopTwiceIsNoOp) {
  EventBridge bridge(recording_config(), transport());
  bridge.start();
  bridge.emit("stdout", "line", "OP_1");

  bridge.stop(std::chrono::seconds(5));
  EXPECT_EQ(bridge.state(), BridgeState::STOPPED);
  bridge.stop(std::chrono::seconds(5));
  EXPECT_EQ(bridge.state(), BridgeState::STOPPED);
  EXPECT_EQ(log_->batch_count(), 1u);
}

TEST_F(BridgeLifecycleTest, StopWithoutStartIsNoOp) {
  EventBridge bridge(recording_config(), transport());
  bridge.emit("stdout", "pending", "OP_1");

  bridge.stop(std::chrono::milliseconds(100));

  EXPECT_EQ(bridge.state(), BridgeState::STOPPED);
  EXPECT_EQ(bridge.stats().queue_size, 1u);
  EXPECT_EQ(log_->batch_count(), 0u);
}

TEST_F(BridgeLifecycleTest, RestartAfterStop) {
  EventBridge bridge(recording_config(), transport());

  bridge.start();
  bridge.emit("stdout", "first", "OP_1");
  bridge.stop(std::chrono::seconds(5));

  bridge.start();
  EXPECT_EQ(bridge.state(), BridgeState::RUNNING);
  bridge.emit("stdout", "second", "OP_1");
  bridge.stop(std::chrono::seconds(5));

  std::vector<Event> events = log_->all_events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].content(), "first");
  EXPECT_EQ(events[1].content(), "second");
}

TEST_F(BridgeLifecycleTest, StopTimeoutLeavesBridgeStopping) {
  log_->delay_ms.store(500);
  EventBridge bridge(recording_config(1), transport());
  bridge.start();
  bridge.emit("stdout", "slow", "OP_1");

  // Let the dispatcher pick the event up and enter the slow send
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  auto start = std::chrono::steady_clock::now();
  bridge.stop(std::chrono::milliseconds(50));
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_LT(elapsed, std::chrono::milliseconds(400));
  EXPECT_EQ(bridge.state(), BridgeState::STOPPING);

  // A later stop() completes once the request returns
  bridge.stop(std::chrono::seconds(5));
  EXPECT_EQ(bridge.state(), BridgeState::STOPPED);
  EXPECT_EQ(bridge.stats().events_sent, 1u);
}

TEST_F(BridgeLifecycleTest, DestructorJoinsAfterTimedOutStop) {
  log_->delay_ms.store(300);
  {
    EventBridge bridge(recording_config(1), transport());
    bridge.start();
    bridge.emit("stdout", "slow", "OP_1");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    bridge.stop(std::chrono::milliseconds(10));
  }
  // The dispatcher finished its send before the bridge went away
  EXPECT_EQ(log_->batch_count(), 1u);
}

TEST_F(BridgeLifecycleTest, DestructorFlushesPendingEvents) {
  {
    EventBridge bridge(recording_config(100), transport());
    bridge.start();
    for (int i = 0; i < 15; ++i) {
      bridge.emit("stdout", "line " + std::to_string(i), "OP_1");
    }
  }
  EXPECT_EQ(log_->total_events(), 15u);
}

TEST_F(BridgeLifecycleTest, RapidCreateDestroyCycles) {
  for (int i = 0; i < 50; ++i) {
    BridgeConfig config = recording_config();
    config.auto_start = true;
    EventBridge bridge(config, transport());
    bridge.emit("stdout", "cycle " + std::to_string(i), "OP_1");
  }
  EXPECT_EQ(log_->total_events(), 50u);
}

TEST_F(BridgeLifecycleTest, ConcurrentEmittersThenDestruction) {
  std::atomic<bool> stop_producers{false};
  std::vector<std::thread> producers;
  {
    auto bridge = std::make_shared<EventBridge>(recording_config(5), transport());
    bridge->start();
    for (int t = 0; t < 4; ++t) {
      producers.emplace_back([bridge, &stop_producers]() {
        int n = 0;
        while (!stop_producers.load()) {
          bridge->emit("stdout", "line " + std::to_string(n++), "OP_1");
          std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
      });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    stop_producers.store(true);
    for (auto& producer : producers) {
      producer.join();
    }
  }
  EXPECT_GT(log_->total_events(), 0u);
  EXPECT_EQ(log_->caller_threads.size(), log_->batch_count());
}

TEST_F(BridgeLifecycleTest, StopCompletesWhileProducerKeepsEmitting) {
  // Sends are slower than the producer, so the queue never runs dry
  log_->delay_ms.store(5);
  BridgeConfig config = recording_config(10);
  config.queue_capacity = 1000;
  auto bridge = std::make_shared<EventBridge>(config, transport());
  bridge->start();

  std::atomic<bool> stop_producer{false};
  std::thread producer([bridge, &stop_producer]() {
    int n = 0;
    while (!stop_producer.load()) {
      bridge->emit("stdout", "line " + std::to_string(n++), "OP_1");
      std::this_thread::sleep_for(std::chrono::microseconds(200));
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  auto start = std::chrono::steady_clock::now();
  bridge->stop(std::chrono::seconds(3));
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(bridge->state(), BridgeState::STOPPED);
  EXPECT_LT(elapsed, std::chrono::seconds(3));

  // Nothing is sent once the dispatcher has exited
  std::uint64_t sent = bridge->stats().events_sent;
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_EQ(bridge->stats().events_sent, sent);

  stop_producer.store(true);
  producer.join();
}

TEST(BridgeStateNames, ToString) {
  EXPECT_STREQ(to_string(BridgeState::DISABLED), "disabled");
  EXPECT_STREQ(to_string(BridgeState::STOPPED), "stopped");
  EXPECT_STREQ(to_string(BridgeState::RUNNING), "running");
  EXPECT_STREQ(to_string(BridgeState::STOPPING), "stopping");
}

}  // namespace testing
}  // namespace collab
