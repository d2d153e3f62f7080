#pragma once

#include "txflow/fsm/action_registry.hpp"
#include "txflow/fsm/transition_context.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace txflow {

// -----------------------------------------------------------------------------
// AfterActionBatch
// -----------------------------------------------------------------------------
// The after-actions of one successful commit. (instance id, commit_version)
// identifies the commit; schedulers use it to drop duplicate hand-overs.
// -----------------------------------------------------------------------------
struct AfterActionBatch {
  std::shared_ptr<StateMachineInstance> instance;
  std::string event;
  std::string from_state;
  std::string to_state;
  std::uint64_t commit_version{0};
  std::vector<NamedAction> actions;
  TransitionContext context;
};

// -----------------------------------------------------------------------------
// IActionScheduler: asynchronous after-action hand-over
// -----------------------------------------------------------------------------
//
// @brief  Lets the TransitionExecutor return from fire() right after the
//         commit and leave after-actions to another thread.
//
// @details
// Contract: a batch accepted by schedule() is run at least once, with its
// actions in declaration order. A batch whose (instance id,
// commit_version) was already accepted is not run again.
//
// schedule() returns false only when the scheduler cannot take the batch
// (e.g. stopped). The executor then runs the actions inline, so dispatch
// stays at-least-once either way.
// -----------------------------------------------------------------------------
class IActionScheduler {
 public:
  virtual ~IActionScheduler() = default;

  virtual bool schedule(AfterActionBatch batch) = 0;
};

}  // namespace txflow
