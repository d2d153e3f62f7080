#pragma once

#include "txflow/fsm/transition_context.hpp"

#include <functional>
#include <string>
#include <unordered_map>

namespace txflow {

class StateMachineInstance;

// Pure predicate. Must not mutate the instance; may block on I/O.
using Guard =
    std::function<bool(const StateMachineInstance&, const TransitionContext&)>;

// Side-effecting step. Reports failure by throwing a std::exception.
using Action =
    std::function<void(StateMachineInstance&, const TransitionContext&)>;

// An action resolved from the registry, keeping its name for error reports.
struct NamedAction {
  std::string name;
  Action fn;
};

// -----------------------------------------------------------------------------
// ActionRegistry
// -----------------------------------------------------------------------------
//
// @brief  Name -> function table consulted by defineMachine().
//
// @details
// Machine specs refer to guards and actions by name so that they can be
// written as data (see machine_spec_json.hpp). defineMachine() resolves
// every name once and copies the function into the definition, so the
// registry is only needed at configuration time and may be discarded
// afterwards.
//
// Thread model: not synchronised. Populate it on one thread before calling
// defineMachine().
// -----------------------------------------------------------------------------
class ActionRegistry {
 public:
  // Throws std::invalid_argument for an empty name, a duplicate name or an
  // empty function.
  void registerGuard(const std::string& name, Guard guard);
  void registerAction(const std::string& name, Action action);

  bool hasGuard(const std::string& name) const;
  bool hasAction(const std::string& name) const;

  // nullptr when the name is not registered.
  const Guard* guard(const std::string& name) const;
  const Action* action(const std::string& name) const;

 private:
  std::unordered_map<std::string, Guard> guards_;
  std::unordered_map<std::string, Action> actions_;
};

}  // namespace txflow
