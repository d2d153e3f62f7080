#pragma once

#include "txflow/time/i_time_provider.hpp"

namespace txflow {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock ITimeProvider
// -----------------------------------------------------------------------------
// Reads std::chrono::system_clock. Used by the demo executable and by any
// embedding application; tests use SimulationTimeProvider instead.
//
// Thread model: stateless, safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace txflow
