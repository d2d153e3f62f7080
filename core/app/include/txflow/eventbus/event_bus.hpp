#pragma once

#include "txflow/events/event.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace txflow {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Synchronous publish-subscribe channel for lifecycle
// observation. The TransitionExecutor, ActionDispatcher and
// HierarchicalBridge publish; loggers, the IpcServer telemetry bridge and
// tests subscribe.
//
// The bus is observation only: no engine decision depends on a subscriber,
// and a transition is already committed when TransitionCommittedEvent is
// delivered.
//
// Thread model: subscribe, unsubscribe and publish are safe from any
// thread. Callbacks run synchronously on the publishing thread, which for
// the executor is the thread that called fire(). Subscribers that do slow
// work should hand the event to their own queue (as IpcServer does).
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback invoked for every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Registers a callback invoked only for events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. A publish() already in progress on another
  // thread may still deliver its current event to the removed callback.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // @brief  Delivers the event to every subscriber registered at the time
  //         of the call.
  //
  // @return Number of callbacks invoked (typed subscribers that ignore the
  //         event's alternative are still counted).
  //
  // @details
  // Callbacks run against an immutable snapshot of the subscriber list and
  // without any lock held, so a callback may publish, subscribe or
  // unsubscribe. A callback that throws is logged and skipped; the
  // remaining subscribers still receive the event and the exception never
  // reaches the publisher, which may be in the middle of a commit.
  // -------------------------------------------------------------------------
  std::size_t publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;
  using SubscriberList = std::vector<SubscriberEntry>;

  // Copy-on-write: writers swap in a new list, publish() only takes a
  // reference to the current one.
  std::shared_ptr<const SubscriberList> snapshot() const;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{1};
  std::shared_ptr<const SubscriberList> subscribers_ =
      std::make_shared<const SubscriberList>();
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace txflow
