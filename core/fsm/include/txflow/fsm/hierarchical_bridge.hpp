#pragma once

#include "txflow/eventbus/event_bus.hpp"
#include "txflow/fsm/action_registry.hpp"
#include "txflow/fsm/errors.hpp"
#include "txflow/fsm/fire_result.hpp"
#include "txflow/fsm/state_machine_instance.hpp"
#include "txflow/time/i_time_provider.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace txflow {

// Outcome of broadcasting one event to every child of a parent.
struct BroadcastResult {
  std::string parent_id;
  std::string event;
  std::vector<std::string> succeeded;
  std::vector<ChildFailure> failures;

  bool ok() const { return failures.empty(); }
  std::size_t attempted() const { return succeeded.size() + failures.size(); }
};

// -----------------------------------------------------------------------------
// HierarchicalBridge
// -----------------------------------------------------------------------------
//
// @brief  Parent/child links between instances of different machines
//         (BankTransaction -> Transactions) and the two propagation
//         primitives built on them.
//
// @details
// Downward, broadcast(): fires one event on every linked child, each child
// independently and in link order. A failed child never stops or undoes
// its siblings; failures are collected into the BroadcastResult.
// broadcastAction() wraps this as an after-action that throws
// PartialFailureError when any child failed, which the executor reports as
// an after-phase ActionError listing the failed children.
//
// Upward, aggregation: allChildrenIn() / allChildrenInGuard() read the
// children's current states through the links every time they are asked.
// There is no pushed completion counter, so the answer stays right under
// out-of-order completion, retries and duplicate reports.
// reportCompletion() fires an event on the child's parent; a parent guard
// that still says "not yet" is a normal outcome.
//
// Thread model:
//   Links are guarded by a std::shared_mutex. broadcast() and the
//   aggregate queries copy the child list under the shared lock and fire or
//   read without it, so child fires never run under the bridge lock.
//
// Ownership:
//   The bridge keeps shared_ptrs to linked instances. It must outlive every
//   definition whose actions were built by broadcastAction(),
//   allChildrenInGuard() or reportCompletionAction().
// -----------------------------------------------------------------------------
class HierarchicalBridge {
 public:
  explicit HierarchicalBridge(const ITimeProvider& clock,
                              EventBus* bus = nullptr);

  HierarchicalBridge(const HierarchicalBridge&) = delete;
  HierarchicalBridge& operator=(const HierarchicalBridge&) = delete;

  // -------------------------------------------------------------------------
  // link(parent, child)
  // -------------------------------------------------------------------------
  // @brief  Appends child to parent's children.
  //
  // @details
  // Linking the same pair again is a no-op. Throws std::invalid_argument
  // for null pointers, a self-link, or a child already linked to a
  // different parent.
  // -------------------------------------------------------------------------
  void link(const std::shared_ptr<StateMachineInstance>& parent,
            const std::shared_ptr<StateMachineInstance>& child);

  // Removes the link. Returns false if child was not linked to parent.
  bool unlink(const std::string& parent_id, const std::string& child_id);

  // Children in link order (empty for an unknown parent).
  std::vector<std::shared_ptr<StateMachineInstance>> children(
      const std::string& parent_id) const;

  std::shared_ptr<StateMachineInstance> parentOf(
      const std::string& child_id) const;

  // -------------------------------------------------------------------------
  // broadcast(parent_id, event, context)
  // -------------------------------------------------------------------------
  // @brief  Fires `event` on every child of parent_id.
  //
  // @details
  // Each child receives a copy of `context` with source
  // "broadcast:<parent_id>" and payload["parent_id"] set. A child fire
  // that throws (e.g. the state store is unreachable) is recorded as a
  // failure like any rejected fire. Publishes BroadcastCompletedEvent.
  // -------------------------------------------------------------------------
  BroadcastResult broadcast(const std::string& parent_id,
                            const std::string& event,
                            const TransitionContext& context = {});

  // True when parent_id has at least one child and every child is
  // currently in `state`.
  bool allChildrenIn(const std::string& parent_id,
                     const std::string& state) const;

  // Fires parent_event on the child's parent. std::nullopt when the child
  // has no parent.
  std::optional<FireResult> reportCompletion(
      const StateMachineInstance& child, const std::string& parent_event,
      const TransitionContext& context = {});

  // ---  Registry adapters ----------------------------------------------------

  // After-action: broadcast(parent.id(), event); throws PartialFailureError
  // if any child failed.
  Action broadcastAction(std::string event);

  // Guard: allChildrenIn(parent.id(), state).
  Guard allChildrenInGuard(std::string state) const;

  // -------------------------------------------------------------------------
  // reportCompletionAction(parent_event)
  // -------------------------------------------------------------------------
  // @brief  After-action for child machines: tells the parent that this
  //         child finished.
  //
  // @details
  // GuardRejected ("not every child is done yet") and NoTransition ("the
  // parent already moved on") are quiet outcomes. Conflict is quiet when
  // the parent can no longer fire parent_event, i.e. a sibling's report
  // won the race. Anything else throws std::runtime_error.
  // -------------------------------------------------------------------------
  Action reportCompletionAction(std::string parent_event);

 private:
  const ITimeProvider& clock_;
  EventBus* bus_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string,
                     std::vector<std::shared_ptr<StateMachineInstance>>>
      children_;
  std::unordered_map<std::string, std::shared_ptr<StateMachineInstance>>
      parents_;
};

}  // namespace txflow
