#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace txflow {

// -----------------------------------------------------------------------------
// Lifecycle events
// -----------------------------------------------------------------------------
// Plain value types published on the EventBus by the TransitionExecutor,
// the ActionDispatcher and the HierarchicalBridge. They carry strings rather
// than engine enums so that subscribers (logging, IpcServer telemetry) do
// not depend on the FSM headers.
//
// All timestamps are epoch milliseconds taken from the engine's
// ITimeProvider, so they follow simulated time in tests.
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// TransitionCommittedEvent
// -----------------------------------------------------------------------------
// Published once per successful commit, after the new state is visible to
// other callers and before any after-action runs.
// -----------------------------------------------------------------------------
struct TransitionCommittedEvent {
  std::string machine;      // Definition name (e.g. "transaction")
  std::string entity_id;    // Instance the transition applied to
  std::string event;        // Event that was fired
  std::string from_state;
  std::string to_state;
  std::uint64_t version{0};  // Instance version after the commit
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// TransitionRejectedEvent
// -----------------------------------------------------------------------------
// Published when fire() returns an error. The entity's state did not change.
// `kind` is one of "NoTransition", "GuardRejected", "ActionError",
// "Conflict", "Timeout".
// -----------------------------------------------------------------------------
struct TransitionRejectedEvent {
  std::string machine;
  std::string entity_id;
  std::string event;
  std::string from_state;
  std::string kind;
  std::string reason;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// ActionFailedEvent
// -----------------------------------------------------------------------------
// Published for every failed action. phase "Before" means the transition
// was aborted; phase "After" means the transition is committed and only
// the follow-up failed, so the caller should retry or compensate.
// -----------------------------------------------------------------------------
struct ActionFailedEvent {
  std::string machine;
  std::string entity_id;
  std::string event;
  std::string action;
  std::string phase;
  std::string message;
  std::size_t failed_children{0};  // Non-zero for broadcast partial failures
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// BroadcastCompletedEvent
// -----------------------------------------------------------------------------
// Published by HierarchicalBridge::broadcast() after every linked child has
// been attempted, whether or not some of them failed.
// -----------------------------------------------------------------------------
struct BroadcastCompletedEvent {
  std::string parent_id;
  std::string event;
  std::size_t attempted{0};
  std::size_t succeeded{0};
  std::vector<std::string> failed_children;
  std::int64_t timestamp_ms{0};
};

}  // namespace txflow
