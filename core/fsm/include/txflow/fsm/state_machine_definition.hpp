#pragma once

#include "txflow/fsm/action_registry.hpp"
#include "txflow/fsm/machine_spec.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace txflow {

// -----------------------------------------------------------------------------
// Transition
// -----------------------------------------------------------------------------
// A validated TransitionSpec with its guard and actions resolved from the
// ActionRegistry. `index` is the declaration position within the machine;
// candidates for the same (from, event) are tried in increasing index.
// An empty `guard` function always passes.
// -----------------------------------------------------------------------------
struct Transition {
  std::size_t index{0};
  std::string from;
  std::string event;
  std::string to;
  std::string guard_name;
  Guard guard;
  std::vector<NamedAction> before_actions;
  std::vector<NamedAction> after_actions;
};

// -----------------------------------------------------------------------------
// StateMachineDefinition
// -----------------------------------------------------------------------------
//
// @brief  Immutable description of the states, events and transitions of
//         one entity type (e.g. "transaction").
//
// @details
// Built once at configuration time by define() / defineMachine(), which
// validate the MachineSpec and throw DefinitionError on the first
// violation. The result is handed out as shared_ptr<const ...> and every
// StateMachineInstance of that type shares it.
//
// Validation rules:
//   - at least one state; state names non-empty and unique
//   - exactly one initial state
//   - event names non-empty, unique, and never equal to a state name
//   - every transition's from/to is a declared state and its event a
//     declared event
//   - no transition leaves a terminal state
//   - every guard/action name is registered in the ActionRegistry
//
// Thread model:
//   All members are const after construction, so every query is safe from
//   any thread without locking.
// -----------------------------------------------------------------------------
class StateMachineDefinition {
  // Only define() can construct; the public constructor takes this key so
  // std::make_shared can reach it.
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

 public:
  static std::shared_ptr<const StateMachineDefinition> define(
      const MachineSpec& spec, const ActionRegistry& registry);

  explicit StateMachineDefinition(ConstructionKey) {}

  StateMachineDefinition(const StateMachineDefinition&) = delete;
  StateMachineDefinition& operator=(const StateMachineDefinition&) = delete;

  const std::string& name() const { return name_; }
  const std::string& initialState() const { return initial_state_; }

  bool hasState(const std::string& state) const;
  bool isTerminal(const std::string& state) const;
  bool hasEvent(const std::string& event) const;

  // -------------------------------------------------------------------------
  // candidates(from, event)
  // -------------------------------------------------------------------------
  // @brief  Transitions declared for (from, event), in declaration order.
  //
  // @return Pointers into this definition (valid for its lifetime). Empty
  //         when nothing matches, which the executor reports as
  //         NoTransition.
  // -------------------------------------------------------------------------
  std::vector<const Transition*> candidates(const std::string& from,
                                            const std::string& event) const;

  // Distinct events with at least one transition out of `state`, sorted.
  std::vector<std::string> eventsFrom(const std::string& state) const;

  // Declared states and events, in declaration order.
  const std::vector<StateSpec>& states() const { return states_; }
  const std::vector<std::string>& events() const { return events_; }
  const std::vector<Transition>& transitions() const { return transitions_; }

 private:
  std::string name_;
  std::string initial_state_;
  std::vector<StateSpec> states_;
  std::vector<std::string> events_;
  std::vector<Transition> transitions_;

  std::set<std::string> state_names_;
  std::set<std::string> terminal_states_;
  std::set<std::string> event_names_;

  // (from, event) -> indices into transitions_, ascending.
  std::map<std::pair<std::string, std::string>, std::vector<std::size_t>>
      index_;
};

// Free-function form used by the engine and the tests.
std::shared_ptr<const StateMachineDefinition> defineMachine(
    const MachineSpec& spec, const ActionRegistry& registry);

}  // namespace txflow
