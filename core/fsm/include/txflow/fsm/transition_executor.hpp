#pragma once

#include "txflow/eventbus/event_bus.hpp"
#include "txflow/fsm/errors.hpp"
#include "txflow/fsm/fire_result.hpp"
#include "txflow/fsm/i_action_scheduler.hpp"
#include "txflow/fsm/state_machine_instance.hpp"
#include "txflow/fsm/transition_context.hpp"
#include "txflow/persistence/i_state_store.hpp"
#include "txflow/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace txflow {

// -----------------------------------------------------------------------------
// TransitionExecutor
// -----------------------------------------------------------------------------
//
// @brief  Resolves, guards, commits and follows up transitions on
//         StateMachineInstances.
//
// @details
// fire(instance, event, context):
//   1. Snapshot (state, version) and look up the candidates for
//      (state, event) in declaration order. None: NoTransition.
//   2. Evaluate guards in order; the first that passes selects the
//      transition. A guard that throws counts as failed. None passes:
//      GuardRejected.
//   3. Run the selected transition's before-actions in order. The first
//      throw aborts: ActionError (phase Before), nothing changed.
//   4. Commit. Under the instance's exclusive lock, re-check that
//      (state, version) still match the snapshot, persist through
//      IStateStore::compareAndSet(), then publish the new state and
//      version in memory. Any mismatch: Conflict, nothing changed.
//   5. After-actions. With a scheduler they are handed over once and the
//      result is marked deferred. Otherwise they run inline in order; a
//      failure is recorded and the remaining actions still run.
//   6. Return the new state.
//
// Guards and before-actions run without any lock, against the snapshot.
// The exclusive lock is held only for step 4, so slow guards never block
// readers and never block other instances.
//
// Timeouts: when context.timeout is set, the elapsed time on the
// ITimeProvider is checked after every guard and every before-action and
// once more before the commit. Exceeding it fails with Timeout before
// anything is committed. The check is cooperative: a guard that never
// returns is not interrupted.
//
// The executor never retries. Conflict and Timeout are returned to the
// caller, who may fire again against the fresh state.
//
// Thread model:
//   fire() and canFire() may be called concurrently from any thread for any
//   instance. The executor holds no mutable state of its own.
//
// Ownership:
//   Borrows the time provider, store, bus and scheduler; all must outlive
//   the executor and every instance bound to it.
// -----------------------------------------------------------------------------
class TransitionExecutor {
 public:
  explicit TransitionExecutor(const ITimeProvider& clock,
                              IStateStore* store = nullptr,
                              EventBus* bus = nullptr,
                              IActionScheduler* scheduler = nullptr);

  TransitionExecutor(const TransitionExecutor&) = delete;
  TransitionExecutor& operator=(const TransitionExecutor&) = delete;

  FireResult fire(StateMachineInstance& instance, const std::string& event,
                  const TransitionContext& context = {});

  // Guard evaluation only: no actions, no commit, no events published.
  bool canFire(const StateMachineInstance& instance, const std::string& event,
               const TransitionContext& context = {}) const;

  IStateStore* store() const { return store_; }
  const ITimeProvider& clock() const { return clock_; }

  // -------------------------------------------------------------------------
  // runAfterActions(instance, actions, context)
  // -------------------------------------------------------------------------
  // @brief  Runs every action in order, converting throws into
  //         ActionFailure (phase After). Never stops early.
  //
  // @details
  // Shared with the ActionDispatcher so inline and deferred after-actions
  // report failures identically.
  // -------------------------------------------------------------------------
  static std::vector<ActionFailure> runAfterActions(
      StateMachineInstance& instance, const std::vector<NamedAction>& actions,
      const TransitionContext& context);

  // Event published for one failed action.
  static ActionFailedEvent makeActionFailedEvent(
      const StateMachineInstance& instance, const std::string& event,
      const ActionFailure& failure, std::int64_t timestamp_ms);

 private:
  // Runs one action; std::nullopt when it returned normally.
  static std::optional<ActionFailure> runAction(
      StateMachineInstance& instance, const NamedAction& action,
      const TransitionContext& context, ActionPhase phase);

  bool budgetExceeded(std::int64_t started_ms,
                      const TransitionContext& context) const;

  FireResult reject(const StateMachineInstance& instance,
                    const StateSnapshot& snap, const std::string& event,
                    TransitionErrorKind kind, std::string message,
                    std::optional<ActionFailure> action = std::nullopt);

  const ITimeProvider& clock_;
  IStateStore* store_;
  EventBus* bus_;
  IActionScheduler* scheduler_;
};

}  // namespace txflow
