#pragma once

#include "txflow/fsm/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace txflow {

// -----------------------------------------------------------------------------
// FireResult
// -----------------------------------------------------------------------------
//
// @brief  Outcome of one fire(): either the new state or a TransitionError.
//
// @details
// Exactly one of `state` / `error` is set.
//
// On success `after_action_failures` lists after-actions that threw. They
// are non-fatal: the transition is committed and stays committed, and the
// caller decides whether to retry the follow-up or fire a compensating
// event. When an IActionScheduler took the after-actions,
// `after_actions_deferred` is true and failures are reported on the
// EventBus instead (ActionFailedEvent).
//
// `from_state` is the state the resolution started from. `version` is the
// instance version after the commit, or the version observed when the fire
// was rejected.
// -----------------------------------------------------------------------------
struct FireResult {
  std::optional<std::string> state;
  std::optional<TransitionError> error;
  std::string from_state;
  std::uint64_t version{0};
  std::vector<ActionFailure> after_action_failures;
  bool after_actions_deferred{false};

  bool ok() const { return state.has_value(); }
  bool hasActionErrors() const { return !after_action_failures.empty(); }

  static FireResult success(std::string from, std::string to,
                            std::uint64_t version) {
    FireResult result;
    result.from_state = std::move(from);
    result.state = std::move(to);
    result.version = version;
    return result;
  }

  static FireResult failure(TransitionError error, std::uint64_t version) {
    FireResult result;
    result.from_state = error.from_state;
    result.version = version;
    result.error = std::move(error);
    return result;
  }
};

}  // namespace txflow
