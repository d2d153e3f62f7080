#include "txflow/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <iterator>
#include <type_traits>

namespace txflow {

namespace {

const char* eventName(const Event& event) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TransitionCommittedEvent>) {
          return "TransitionCommittedEvent";
        } else if constexpr (std::is_same_v<T, TransitionRejectedEvent>) {
          return "TransitionRejectedEvent";
        } else if constexpr (std::is_same_v<T, ActionFailedEvent>) {
          return "ActionFailedEvent";
        } else {
          return "BroadcastCompletedEvent";
        }
      },
      event);
}

}  // namespace

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  auto next = std::make_shared<SubscriberList>(*subscribers_);
  const SubscriptionId id = next_id_++;
  next->emplace_back(id, std::move(callback));
  subscribers_ = std::move(next);
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  const auto match = [id](const SubscriberEntry& e) { return e.first == id; };
  if (std::none_of(subscribers_->begin(), subscribers_->end(), match)) {
    return;
  }
  auto next = std::make_shared<SubscriberList>();
  next->reserve(subscribers_->size() - 1);
  std::copy_if(subscribers_->begin(), subscribers_->end(),
               std::back_inserter(*next),
               [&match](const SubscriberEntry& e) { return !match(e); });
  subscribers_ = std::move(next);
}

// -----------------------------------------------------------------------------
// publish(): deliver outside the lock, isolate throwing subscribers
// -----------------------------------------------------------------------------
std::size_t EventBus::publish(const Event& event) {
  const auto subscribers = snapshot();

  for (const auto& [id, callback] : *subscribers) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      std::cerr << "[EventBus] subscriber " << id << " threw on "
                << eventName(event) << ": " << e.what() << "\n";
    }
  }
  return subscribers->size();
}

std::size_t EventBus::subscriberCount() const { return snapshot()->size(); }

std::shared_ptr<const EventBus::SubscriberList> EventBus::snapshot() const {
  std::lock_guard lock(mutex_);
  return subscribers_;
}

}  // namespace txflow
