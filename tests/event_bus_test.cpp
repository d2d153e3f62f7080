// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for txflow::EventBus.
//
// Validates:
//   - Generic subscription receives every lifecycle event type
//   - Typed subscription receives only its type
//   - Unsubscribe stops delivery
//   - Re-entrant publish / unsubscribe from inside a callback
//   - Data integrity through the variant dispatch path
//   - A throwing subscriber is isolated from the publisher and its peers
//
// All tests are single-threaded. Cross-thread delivery is covered by the
// dispatcher and engine suites.
// =============================================================================

#include "txflow/eventbus/event_bus.hpp"
#include "txflow/events/event.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  txflow::EventBus bus;

  static txflow::TransitionCommittedEvent makeCommitted(
      const std::string& entity, std::uint64_t version) {
    txflow::TransitionCommittedEvent e;
    e.machine = "transaction";
    e.entity_id = entity;
    e.event = "depositing_via_api";
    e.from_state = "draft";
    e.to_state = "depositing";
    e.version = version;
    e.timestamp_ms = 1000;
    return e;
  }

  static txflow::TransitionRejectedEvent makeRejected(
      const std::string& entity) {
    txflow::TransitionRejectedEvent e;
    e.machine = "transaction";
    e.entity_id = entity;
    e.event = "bank_transaction_succeeded";
    e.from_state = "deposited";
    e.kind = "NoTransition";
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber sees every alternative of the Event variant.
// Why: The IPC telemetry bridge subscribes generically.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int calls = 0;
  bus.subscribe([&calls](const txflow::Event&) { ++calls; });

  bus.publish(makeCommitted("tx-1", 1));
  bus.publish(makeRejected("tx-1"));
  bus.publish(txflow::ActionFailedEvent{});
  bus.publish(txflow::BroadcastCompletedEvent{});

  EXPECT_EQ(calls, 4);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersByType) {
  std::vector<std::string> committed;
  bus.subscribe<txflow::TransitionCommittedEvent>(
      [&committed](const txflow::TransitionCommittedEvent& e) {
        committed.push_back(e.entity_id);
      });

  bus.publish(makeRejected("tx-9"));
  bus.publish(makeCommitted("tx-1", 1));
  bus.publish(makeCommitted("tx-2", 1));

  ASSERT_EQ(committed.size(), 2u);
  EXPECT_EQ(committed[0], "tx-1");
  EXPECT_EQ(committed[1], "tx-2");
}

// -----------------------------------------------------------------------------
// 3. publish() reports how many callbacks were invoked.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, PublishReturnsSubscriberCount) {
  EXPECT_EQ(bus.publish(makeCommitted("tx-1", 1)), 0u);

  bus.subscribe([](const txflow::Event&) {});
  bus.subscribe<txflow::ActionFailedEvent>(
      [](const txflow::ActionFailedEvent&) {});

  EXPECT_EQ(bus.subscriberCount(), 2u);
  EXPECT_EQ(bus.publish(makeCommitted("tx-1", 1)), 2u);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe() the callback is no longer invoked; unknown ids are
//    ignored.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  auto id = bus.subscribe([&calls](const txflow::Event&) { ++calls; });

  bus.publish(makeCommitted("tx-1", 1));
  bus.unsubscribe(id);
  bus.unsubscribe(9999);
  bus.publish(makeCommitted("tx-1", 2));

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. A callback may publish and unsubscribe without deadlocking.
// Why: Callbacks run outside the bus lock; the executor publishes from
//      inside after-actions that were themselves triggered by a publish.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ReentrantPublishAndUnsubscribe) {
  int rejected_seen = 0;
  txflow::EventBus::SubscriptionId self = 0;

  self = bus.subscribe<txflow::TransitionCommittedEvent>(
      [this, &self](const txflow::TransitionCommittedEvent& e) {
        bus.publish(makeRejected(e.entity_id));
        bus.unsubscribe(self);
      });
  bus.subscribe<txflow::TransitionRejectedEvent>(
      [&rejected_seen](const txflow::TransitionRejectedEvent&) {
        ++rejected_seen;
      });

  bus.publish(makeCommitted("tx-1", 1));
  bus.publish(makeCommitted("tx-1", 2));

  EXPECT_EQ(rejected_seen, 1);
}

// -----------------------------------------------------------------------------
// 6. Fields survive the variant round trip unchanged.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, DataIntegrity) {
  txflow::BroadcastCompletedEvent received;
  bus.subscribe<txflow::BroadcastCompletedEvent>(
      [&received](const txflow::BroadcastCompletedEvent& e) { received = e; });

  txflow::BroadcastCompletedEvent sent;
  sent.parent_id = "bt-1";
  sent.event = "bank_transaction_created";
  sent.attempted = 2;
  sent.succeeded = 1;
  sent.failed_children = {"tx-2"};
  sent.timestamp_ms = 42;
  bus.publish(sent);

  EXPECT_EQ(received.parent_id, "bt-1");
  EXPECT_EQ(received.event, "bank_transaction_created");
  EXPECT_EQ(received.attempted, 2u);
  EXPECT_EQ(received.succeeded, 1u);
  ASSERT_EQ(received.failed_children.size(), 1u);
  EXPECT_EQ(received.failed_children[0], "tx-2");
  EXPECT_EQ(received.timestamp_ms, 42);
}

// -----------------------------------------------------------------------------
// 7. A subscriber that throws does not stop delivery to later subscribers and
//    does not propagate to the publisher.
// Why: The executor publishes after a commit; an observer must not be able
//      to abort the rest of fire().
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberIsIsolated) {
  int delivered = 0;
  bus.subscribe([](const txflow::Event&) {
    throw std::runtime_error("observer bug");
  });
  bus.subscribe([&delivered](const txflow::Event&) { ++delivered; });

  std::size_t invoked = 0;
  EXPECT_NO_THROW(invoked = bus.publish(makeCommitted("tx-1", 1)));

  EXPECT_EQ(invoked, 2u);
  EXPECT_EQ(delivered, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}
