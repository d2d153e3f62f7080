// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for txflow::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO semantics of push / pop / try_pop
//   - Blocking pop() waits for a producer
//   - close(): producers are refused, consumers drain then get nullopt
//   - reopen() after close()
//   - Thread-safety under concurrent multi-producer / multi-consumer load
//
// Threading model:
//   Threads spawned by a test are joined before its assertions.
// =============================================================================

#include "txflow/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  txflow::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Items come back in push order.
// Why: After-action batches of one instance must run in commit order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoOrder) {
  EXPECT_TRUE(queue.empty());
  for (int i = 0; i < 50; ++i) {
    EXPECT_TRUE(queue.push(i));
  }
  EXPECT_EQ(queue.size(), 50u);

  for (int i = 0; i < 50; ++i) {
    auto item = queue.pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. try_pop() never blocks.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPop) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(99);
  auto item = queue.try_pop();
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, 99);
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 3. Blocking pop() must wait until another thread pushes.
// Why: Exercises the condition_variable wake-up path used by worker loops.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};

  std::thread consumer([this, &received] {
    auto item = queue.pop();
    received.store(item.value_or(-2));
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);  // Still blocked

  queue.push(77);
  consumer.join();

  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 4. close() wakes a blocked consumer with nullopt.
// Why: This is how ActionDispatcher::stop() ends its worker loop.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, CloseWakesBlockedConsumer) {
  std::atomic<bool> got_nullopt{false};

  std::thread consumer([this, &got_nullopt] {
    got_nullopt.store(!queue.pop().has_value());
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.close();
  consumer.join();

  EXPECT_TRUE(got_nullopt.load());
  EXPECT_TRUE(queue.closed());
}

// -----------------------------------------------------------------------------
// 5. A closed queue refuses new items but still hands out queued ones.
// Why: Work accepted before shutdown must not be lost.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, CloseDrainsThenEnds) {
  queue.push(1);
  queue.push(2);
  queue.close();

  EXPECT_FALSE(queue.push(3));

  EXPECT_EQ(queue.pop().value_or(-1), 1);
  EXPECT_EQ(queue.pop().value_or(-1), 2);
  EXPECT_FALSE(queue.pop().has_value());
}

// -----------------------------------------------------------------------------
// 6. reopen() accepts items again.
// Why: Components are restartable (stop() then start()).
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ReopenAfterClose) {
  queue.close();
  EXPECT_FALSE(queue.push(1));

  queue.reopen();
  EXPECT_FALSE(queue.closed());
  EXPECT_TRUE(queue.push(2));
  EXPECT_EQ(queue.pop().value_or(-1), 2);
}

// -----------------------------------------------------------------------------
// 7. Concurrent multi-producer, multi-consumer: every item popped once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::vector<int>> per_consumer(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &per_consumer] {
      while (auto item = queue.pop()) {
        per_consumer[c].push_back(*item);
      }
    });
  }

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      const int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  for (auto& t : producers) t.join();
  queue.close();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
