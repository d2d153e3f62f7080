#pragma once

#include "txflow/events/lifecycle_events.hpp"

#include <variant>

namespace txflow {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by the EventBus. A closed std::variant keeps
// events as values (safe to copy into the IpcServer telemetry queue) and
// lets subscribers dispatch with std::get_if / std::visit.
// -----------------------------------------------------------------------------
using Event = std::variant<
    TransitionCommittedEvent,
    TransitionRejectedEvent,
    ActionFailedEvent,
    BroadcastCompletedEvent>;

}  // namespace txflow
