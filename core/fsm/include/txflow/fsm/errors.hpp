#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace txflow {

// -----------------------------------------------------------------------------
// DefinitionError
// -----------------------------------------------------------------------------
// Thrown by defineMachine() and the MachineSpec JSON loader when a machine
// description is malformed. Configuration time only: once a definition has
// been published nothing at runtime raises it.
// -----------------------------------------------------------------------------
class DefinitionError : public std::runtime_error {
 public:
  explicit DefinitionError(const std::string& message)
      : std::runtime_error("definition error: " + message) {}
};

// -----------------------------------------------------------------------------
// TransitionErrorKind
// -----------------------------------------------------------------------------
// Runtime outcomes of a failed fire(). In every case the instance's state is
// unchanged, except ActionError with phase After (see ActionPhase).
// -----------------------------------------------------------------------------
enum class TransitionErrorKind {
  NoTransition,   // No transition declared for (current state, event)
  GuardRejected,  // Candidates existed, every guard failed
  ActionError,    // A before-action threw (state unchanged)
  Conflict,       // Optimistic commit lost against another writer
  Timeout         // Guard/before-action evaluation exceeded the budget
};

inline const char* toString(TransitionErrorKind kind) {
  switch (kind) {
    case TransitionErrorKind::NoTransition:
      return "NoTransition";
    case TransitionErrorKind::GuardRejected:
      return "GuardRejected";
    case TransitionErrorKind::ActionError:
      return "ActionError";
    case TransitionErrorKind::Conflict:
      return "Conflict";
    case TransitionErrorKind::Timeout:
      return "Timeout";
  }
  return "Unknown";
}

// Before: the transition was aborted. After: the transition is committed and
// only the follow-up work failed.
enum class ActionPhase { Before, After };

inline const char* toString(ActionPhase phase) {
  return phase == ActionPhase::Before ? "Before" : "After";
}

// One child whose broadcast fire failed.
struct ChildFailure {
  std::string child_id;
  std::string event;
  TransitionErrorKind kind{TransitionErrorKind::NoTransition};
  std::string message;
};

// -----------------------------------------------------------------------------
// ActionFailure
// -----------------------------------------------------------------------------
// A guard/action function reports failure by throwing; the executor catches
// the exception at the boundary and records it here. child_failures is
// filled when the action was a HierarchicalBridge broadcast that failed for
// some children (PartialFailureError).
// -----------------------------------------------------------------------------
struct ActionFailure {
  ActionPhase phase{ActionPhase::Before};
  std::string action;
  std::string message;
  std::vector<ChildFailure> child_failures;
};

// -----------------------------------------------------------------------------
// TransitionError
// -----------------------------------------------------------------------------
// Value returned inside FireResult when fire() did not commit. `action` is
// set only for kind == ActionError.
// -----------------------------------------------------------------------------
struct TransitionError {
  TransitionErrorKind kind{TransitionErrorKind::NoTransition};
  std::string entity_id;
  std::string event;
  std::string from_state;
  std::string message;
  std::optional<ActionFailure> action;
};

// -----------------------------------------------------------------------------
// PartialFailureError
// -----------------------------------------------------------------------------
// Thrown by the broadcasting after-action when at least one child fire
// failed. Siblings that succeeded stay committed; the executor copies
// failures() into ActionFailure::child_failures.
// -----------------------------------------------------------------------------
class PartialFailureError : public std::runtime_error {
 public:
  PartialFailureError(std::string event, std::vector<ChildFailure> failures)
      : std::runtime_error("broadcast of '" + event + "' failed for " +
                           std::to_string(failures.size()) + " child(ren)"),
        event_(std::move(event)),
        failures_(std::move(failures)) {}

  const std::string& event() const { return event_; }
  const std::vector<ChildFailure>& failures() const { return failures_; }

 private:
  std::string event_;
  std::vector<ChildFailure> failures_;
};

}  // namespace txflow
