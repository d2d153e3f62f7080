#include "txflow/fsm/hierarchical_bridge.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace txflow {

HierarchicalBridge::HierarchicalBridge(const ITimeProvider& clock,
                                       EventBus* bus)
    : clock_(clock), bus_(bus) {}

// -----------------------------------------------------------------------------
// Links
// -----------------------------------------------------------------------------
void HierarchicalBridge::link(
    const std::shared_ptr<StateMachineInstance>& parent,
    const std::shared_ptr<StateMachineInstance>& child) {
  if (!parent || !child) {
    throw std::invalid_argument("link: null instance");
  }
  if (parent->id() == child->id()) {
    throw std::invalid_argument("link: " + parent->id() +
                                " cannot be its own child");
  }

  std::unique_lock lock(mutex_);
  auto it = parents_.find(child->id());
  if (it != parents_.end()) {
    if (it->second->id() == parent->id()) {
      return;
    }
    throw std::invalid_argument("link: " + child->id() +
                                " is already linked to " + it->second->id());
  }
  parents_.emplace(child->id(), parent);
  children_[parent->id()].push_back(child);
}

bool HierarchicalBridge::unlink(const std::string& parent_id,
                                const std::string& child_id) {
  std::unique_lock lock(mutex_);
  auto parent_it = parents_.find(child_id);
  if (parent_it == parents_.end() || parent_it->second->id() != parent_id) {
    return false;
  }
  parents_.erase(parent_it);

  auto& kids = children_[parent_id];
  kids.erase(std::remove_if(kids.begin(), kids.end(),
                            [&child_id](const auto& c) {
                              return c->id() == child_id;
                            }),
             kids.end());
  if (kids.empty()) {
    children_.erase(parent_id);
  }
  return true;
}

std::vector<std::shared_ptr<StateMachineInstance>>
HierarchicalBridge::children(const std::string& parent_id) const {
  std::shared_lock lock(mutex_);
  auto it = children_.find(parent_id);
  if (it == children_.end()) {
    return {};
  }
  return it->second;
}

std::shared_ptr<StateMachineInstance> HierarchicalBridge::parentOf(
    const std::string& child_id) const {
  std::shared_lock lock(mutex_);
  auto it = parents_.find(child_id);
  return it == parents_.end() ? nullptr : it->second;
}

// -----------------------------------------------------------------------------
// broadcast(): fire on every child independently
// -----------------------------------------------------------------------------
BroadcastResult HierarchicalBridge::broadcast(
    const std::string& parent_id, const std::string& event,
    const TransitionContext& context) {
  BroadcastResult result;
  result.parent_id = parent_id;
  result.event = event;

  TransitionContext child_context = context;
  child_context.source = "broadcast:" + parent_id;
  if (!child_context.payload.is_object()) {
    child_context.payload = nlohmann::json::object();
  }
  child_context.payload["parent_id"] = parent_id;

  for (const auto& child : children(parent_id)) {
    try {
      FireResult fired = child->fire(event, child_context);
      if (fired.ok()) {
        result.succeeded.push_back(child->id());
      } else {
        result.failures.push_back(ChildFailure{child->id(), event,
                                               fired.error->kind,
                                               fired.error->message});
      }
    } catch (const std::exception& e) {
      result.failures.push_back(ChildFailure{
          child->id(), event, TransitionErrorKind::ActionError, e.what()});
    }
  }

  for (const auto& failure : result.failures) {
    std::cerr << "[HierarchicalBridge] " << parent_id << " -> "
              << failure.child_id << " '" << event << "' failed ("
              << toString(failure.kind) << "): " << failure.message << "\n";
  }

  if (bus_ != nullptr) {
    BroadcastCompletedEvent done;
    done.parent_id = parent_id;
    done.event = event;
    done.attempted = result.attempted();
    done.succeeded = result.succeeded.size();
    for (const auto& failure : result.failures) {
      done.failed_children.push_back(failure.child_id);
    }
    done.timestamp_ms = clock_.now_ms();
    bus_->publish(done);
  }

  return result;
}

// -----------------------------------------------------------------------------
// Upward aggregation
// -----------------------------------------------------------------------------
bool HierarchicalBridge::allChildrenIn(const std::string& parent_id,
                                       const std::string& state) const {
  const auto kids = children(parent_id);
  if (kids.empty()) {
    return false;
  }
  return std::all_of(kids.begin(), kids.end(), [&state](const auto& child) {
    return child->currentState() == state;
  });
}

std::optional<FireResult> HierarchicalBridge::reportCompletion(
    const StateMachineInstance& child, const std::string& parent_event,
    const TransitionContext& context) {
  auto parent = parentOf(child.id());
  if (!parent) {
    return std::nullopt;
  }
  TransitionContext parent_context = context;
  parent_context.source = "child:" + child.id();
  return parent->fire(parent_event, parent_context);
}

// -----------------------------------------------------------------------------
// Registry adapters
// -----------------------------------------------------------------------------
Action HierarchicalBridge::broadcastAction(std::string event) {
  return [this, event = std::move(event)](StateMachineInstance& parent,
                                          const TransitionContext& context) {
    BroadcastResult result = broadcast(parent.id(), event, context);
    if (!result.ok()) {
      throw PartialFailureError(event, std::move(result.failures));
    }
  };
}

Guard HierarchicalBridge::allChildrenInGuard(std::string state) const {
  return [this, state = std::move(state)](const StateMachineInstance& parent,
                                          const TransitionContext&) {
    return allChildrenIn(parent.id(), state);
  };
}

Action HierarchicalBridge::reportCompletionAction(std::string parent_event) {
  return [this, parent_event = std::move(parent_event)](
             StateMachineInstance& child, const TransitionContext& context) {
    auto fired = reportCompletion(child, parent_event, context);
    if (!fired || fired->ok()) {
      return;
    }

    const TransitionError& error = *fired->error;
    switch (error.kind) {
      case TransitionErrorKind::GuardRejected:
      case TransitionErrorKind::NoTransition:
        return;
      case TransitionErrorKind::Conflict: {
        auto parent = parentOf(child.id());
        if (parent && !parent->canFire(parent_event, context)) {
          return;
        }
        break;
      }
      case TransitionErrorKind::ActionError:
      case TransitionErrorKind::Timeout:
        break;
    }
    throw std::runtime_error("report of " + child.id() + " to parent '" +
                             parent_event + "' failed (" +
                             toString(error.kind) + "): " + error.message);
  };
}

}  // namespace txflow
