#pragma once

#include <cstdint>

namespace txflow {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract clock
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for the engine: transition timestamps, history
//         records, lifecycle events, and the guard/before-action timeout
//         budget of TransitionExecutor::fire().
//
// @details
// Components receive `const ITimeProvider&` and never read the system
// clock themselves. Production wiring injects LiveTimeProvider; tests
// inject SimulationTimeProvider and move time forward explicitly, which
// makes timeout behaviour deterministic (a guard can "take" 500 ms by
// advancing the simulated clock).
//
// Thread-safety contract:
//   Implementations must allow concurrent now_ms() calls from any thread.
//
// Ownership:
//   Borrowed by reference. The provider must outlive every component that
//   holds it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch (0 for a fresh simulated clock).
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace txflow
