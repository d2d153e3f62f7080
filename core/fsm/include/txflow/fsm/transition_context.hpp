#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace txflow {

// -----------------------------------------------------------------------------
// TransitionContext
// -----------------------------------------------------------------------------
// Caller-supplied input to fire() and canFire(), handed unchanged to every
// guard and action of the resolved transition.
//
//   payload  Free-form data from the trigger (API body, webhook fields).
//            Guards and actions read it; the engine never interprets it.
//   timeout  Budget for guard and before-action evaluation, measured on the
//            executor's ITimeProvider. std::nullopt means unbounded.
//   source   Who triggered the fire ("api", "job", "broadcast:<parent>").
//            Used for logging only.
//
//   commit_version
//            Set by the engine for after-actions only: the instance version
//            of the commit that scheduled them, which may be older than
//            instance.version() once a deferred batch runs. 0 while guards
//            and before-actions run.
// -----------------------------------------------------------------------------
struct TransitionContext {
  nlohmann::json payload = nlohmann::json::object();
  std::optional<std::chrono::milliseconds> timeout;
  std::string source;
  std::uint64_t commit_version{0};
};

}  // namespace txflow
