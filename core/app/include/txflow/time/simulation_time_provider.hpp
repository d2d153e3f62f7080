#pragma once

#include "txflow/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace txflow {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose time only moves when the owner says so.
//
// @details
// Used by tests to make timestamps reproducible and to exercise the
// TransitionExecutor timeout path without sleeping: a guard or
// before-action under test calls advance_by() to simulate slow I/O, and
// the executor observes the elapsed time on its next budget check.
//
// Thread model:
//   The value is a std::atomic<int64_t>, so readers and writers on
//   different threads need no further synchronisation.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to an absolute time. Monotonicity is the caller's job.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms and returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace txflow
