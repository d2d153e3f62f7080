#include "txflow/fsm/transition_executor.hpp"

#include <iostream>
#include <mutex>
#include <utility>

namespace txflow {

namespace {

// Evaluates one guard. A guard that throws is treated as not passing.
bool passes(const Transition& transition, const StateMachineInstance& instance,
            const TransitionContext& context) {
  if (!transition.guard) {
    return true;
  }
  try {
    return transition.guard(instance, context);
  } catch (const std::exception& e) {
    std::cerr << "[TransitionExecutor] guard '" << transition.guard_name
              << "' threw for " << instance.id() << ": " << e.what()
              << "\n";
    return false;
  }
}

}  // namespace

TransitionExecutor::TransitionExecutor(const ITimeProvider& clock,
                                       IStateStore* store, EventBus* bus,
                                       IActionScheduler* scheduler)
    : clock_(clock), store_(store), bus_(bus), scheduler_(scheduler) {}

// -----------------------------------------------------------------------------
// fire()
// -----------------------------------------------------------------------------
FireResult TransitionExecutor::fire(StateMachineInstance& instance,
                                    const std::string& event,
                                    const TransitionContext& context) {
  const std::int64_t started_ms = clock_.now_ms();
  const StateMachineDefinition& def = instance.definition();

  // ---  1) Snapshot and candidate lookup -------------------------------------
  const StateSnapshot snap = instance.snapshot();
  const auto candidates = def.candidates(snap.state, event);
  if (candidates.empty()) {
    return reject(instance, snap, event, TransitionErrorKind::NoTransition,
                  "no transition for '" + event + "' from '" + snap.state +
                      "'");
  }

  // ---  2) Guards: first pass wins ------------------------------------------
  const Transition* selected = nullptr;
  for (const Transition* candidate : candidates) {
    const bool ok = passes(*candidate, instance, context);
    if (budgetExceeded(started_ms, context)) {
      return reject(instance, snap, event, TransitionErrorKind::Timeout,
                    "guard evaluation exceeded " +
                        std::to_string(context.timeout->count()) + " ms");
    }
    if (ok) {
      selected = candidate;
      break;
    }
  }
  if (selected == nullptr) {
    return reject(instance, snap, event, TransitionErrorKind::GuardRejected,
                  "all " + std::to_string(candidates.size()) +
                      " guard(s) rejected '" + event + "' from '" +
                      snap.state + "'");
  }

  // ---  3) Before-actions: first failure aborts -----------------------------
  for (const auto& action : selected->before_actions) {
    auto failure = runAction(instance, action, context, ActionPhase::Before);
    if (failure) {
      std::string message = "before-action '" + action.name +
                            "' failed: " + failure->message;
      return reject(instance, snap, event, TransitionErrorKind::ActionError,
                    std::move(message), std::move(failure));
    }
    if (budgetExceeded(started_ms, context)) {
      return reject(instance, snap, event, TransitionErrorKind::Timeout,
                    "before-actions exceeded " +
                        std::to_string(context.timeout->count()) + " ms");
    }
  }
  if (budgetExceeded(started_ms, context)) {
    return reject(instance, snap, event, TransitionErrorKind::Timeout,
                  "budget of " + std::to_string(context.timeout->count()) +
                      " ms exhausted before commit");
  }

  // ---  4) Commit under the per-instance exclusive lock ---------------------
  const std::int64_t commit_ms = clock_.now_ms();
  std::uint64_t committed_version = 0;
  bool conflict = false;
  std::string conflict_reason;
  {
    std::unique_lock lock(instance.mutex_);
    if (instance.state_ != snap.state || instance.version_ != snap.version) {
      conflict = true;
      conflict_reason = "instance moved to '" + instance.state_ +
                        "' (v" + std::to_string(instance.version_) +
                        ") during resolution";
    } else if (store_ != nullptr &&
               !store_->compareAndSet(instance.id(), snap.state,
                                      snap.version, selected->to)) {
      conflict = true;
      conflict_reason = "state store rejected compare-and-set at v" +
                        std::to_string(snap.version);
    } else {
      instance.applyCommitLocked(event, selected->to, commit_ms);
      committed_version = instance.version_;
    }
  }
  if (conflict) {
    return reject(instance, snap, event, TransitionErrorKind::Conflict,
                  std::move(conflict_reason));
  }

  if (bus_ != nullptr) {
    bus_->publish(TransitionCommittedEvent{def.name(), instance.id(), event,
                                           snap.state, selected->to,
                                           committed_version, commit_ms});
  }

  FireResult result =
      FireResult::success(snap.state, selected->to, committed_version);

  // ---  5) After-actions ----------------------------------------------------
  if (selected->after_actions.empty()) {
    return result;
  }

  TransitionContext after_context = context;
  after_context.commit_version = committed_version;

  if (scheduler_ != nullptr) {
    AfterActionBatch batch{instance.shared_from_this(), event, snap.state,
                           selected->to, committed_version,
                           selected->after_actions, after_context};
    if (scheduler_->schedule(std::move(batch))) {
      result.after_actions_deferred = true;
      return result;
    }
    std::cerr << "[TransitionExecutor] scheduler refused after-actions for "
              << instance.id() << " v" << committed_version
              << "; running inline\n";
  }

  result.after_action_failures =
      runAfterActions(instance, selected->after_actions, after_context);
  for (const auto& failure : result.after_action_failures) {
    std::cerr << "[TransitionExecutor] after-action '" << failure.action
              << "' failed for " << instance.id() << " (" << snap.state
              << " -> " << selected->to << ", committed): " << failure.message
              << "\n";
    if (bus_ != nullptr) {
      bus_->publish(
          makeActionFailedEvent(instance, event, failure, clock_.now_ms()));
    }
  }

  // ---  6) New state ---------------------------------------------------------
  return result;
}

// -----------------------------------------------------------------------------
// canFire()
// -----------------------------------------------------------------------------
bool TransitionExecutor::canFire(const StateMachineInstance& instance,
                                 const std::string& event,
                                 const TransitionContext& context) const {
  const auto candidates =
      instance.definition().candidates(instance.currentState(), event);
  for (const Transition* candidate : candidates) {
    if (passes(*candidate, instance, context)) {
      return true;
    }
  }
  return false;
}

// -----------------------------------------------------------------------------
// runAfterActions() / runAction()
// -----------------------------------------------------------------------------
std::vector<ActionFailure> TransitionExecutor::runAfterActions(
    StateMachineInstance& instance, const std::vector<NamedAction>& actions,
    const TransitionContext& context) {
  std::vector<ActionFailure> failures;
  for (const auto& action : actions) {
    if (auto failure =
            runAction(instance, action, context, ActionPhase::After)) {
      failures.push_back(std::move(*failure));
    }
  }
  return failures;
}

std::optional<ActionFailure> TransitionExecutor::runAction(
    StateMachineInstance& instance, const NamedAction& action,
    const TransitionContext& context, ActionPhase phase) {
  try {
    action.fn(instance, context);
    return std::nullopt;
  } catch (const PartialFailureError& e) {
    return ActionFailure{phase, action.name, e.what(), e.failures()};
  } catch (const std::exception& e) {
    return ActionFailure{phase, action.name, e.what(), {}};
  }
}

ActionFailedEvent TransitionExecutor::makeActionFailedEvent(
    const StateMachineInstance& instance, const std::string& event,
    const ActionFailure& failure, std::int64_t timestamp_ms) {
  ActionFailedEvent e;
  e.machine = instance.definition().name();
  e.entity_id = instance.id();
  e.event = event;
  e.action = failure.action;
  e.phase = toString(failure.phase);
  e.message = failure.message;
  e.failed_children = failure.child_failures.size();
  e.timestamp_ms = timestamp_ms;
  return e;
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
bool TransitionExecutor::budgetExceeded(std::int64_t started_ms,
                                        const TransitionContext& context) const {
  if (!context.timeout) {
    return false;
  }
  return clock_.now_ms() - started_ms > context.timeout->count();
}

FireResult TransitionExecutor::reject(const StateMachineInstance& instance,
                                      const StateSnapshot& snap,
                                      const std::string& event,
                                      TransitionErrorKind kind,
                                      std::string message,
                                      std::optional<ActionFailure> action) {
  if (kind != TransitionErrorKind::NoTransition &&
      kind != TransitionErrorKind::GuardRejected) {
    std::cerr << "[TransitionExecutor] " << toString(kind) << " on "
              << instance.id() << " '" << event << "': " << message << "\n";
  }

  if (bus_ != nullptr) {
    const std::int64_t now = clock_.now_ms();
    if (action) {
      bus_->publish(makeActionFailedEvent(instance, event, *action, now));
    }
    bus_->publish(TransitionRejectedEvent{instance.definition().name(),
                                          instance.id(), event, snap.state,
                                          toString(kind), message, now});
  }

  TransitionError error;
  error.kind = kind;
  error.entity_id = instance.id();
  error.event = event;
  error.from_state = snap.state;
  error.message = std::move(message);
  error.action = std::move(action);
  return FireResult::failure(std::move(error), snap.version);
}

}  // namespace txflow
