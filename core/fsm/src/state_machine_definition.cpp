#include "txflow/fsm/state_machine_definition.hpp"

#include "txflow/fsm/errors.hpp"

namespace txflow {

namespace {

std::string machineLabel(const MachineSpec& spec) {
  return spec.name.empty() ? std::string("<unnamed>") : spec.name;
}

std::string transitionLabel(const TransitionSpec& t) {
  return "(" + t.from + " --" + t.event + "--> " + t.to + ")";
}

std::vector<NamedAction> resolveActions(const std::vector<std::string>& names,
                                        const ActionRegistry& registry,
                                        const std::string& where) {
  std::vector<NamedAction> resolved;
  resolved.reserve(names.size());
  for (const auto& action_name : names) {
    const Action* fn = registry.action(action_name);
    if (fn == nullptr) {
      throw DefinitionError(where + ": unknown action '" + action_name + "'");
    }
    resolved.push_back(NamedAction{action_name, *fn});
  }
  return resolved;
}

}  // namespace

// -----------------------------------------------------------------------------
// define(): validate the spec and build the immutable definition
// -----------------------------------------------------------------------------
std::shared_ptr<const StateMachineDefinition> StateMachineDefinition::define(
    const MachineSpec& spec, const ActionRegistry& registry) {
  const std::string machine = machineLabel(spec);

  auto def = std::make_shared<StateMachineDefinition>(ConstructionKey{});
  def->name_ = spec.name;

  // ---  1) States -----------------------------------------------------------
  if (spec.states.empty()) {
    throw DefinitionError(machine + ": state set is empty");
  }
  std::size_t initial_count = 0;
  for (const auto& state : spec.states) {
    if (state.name.empty()) {
      throw DefinitionError(machine + ": state name must not be empty");
    }
    if (!def->state_names_.insert(state.name).second) {
      throw DefinitionError(machine + ": duplicate state '" + state.name +
                            "'");
    }
    if (state.initial) {
      ++initial_count;
      def->initial_state_ = state.name;
    }
    if (state.terminal) {
      def->terminal_states_.insert(state.name);
    }
  }
  if (initial_count != 1) {
    throw DefinitionError(machine + ": expected exactly one initial state, "
                          "found " + std::to_string(initial_count));
  }
  def->states_ = spec.states;

  // ---  2) Events -----------------------------------------------------------
  for (const auto& event : spec.events) {
    if (event.empty()) {
      throw DefinitionError(machine + ": event name must not be empty");
    }
    if (def->state_names_.count(event) > 0) {
      throw DefinitionError(machine + ": event '" + event +
                            "' collides with a state name");
    }
    if (!def->event_names_.insert(event).second) {
      throw DefinitionError(machine + ": duplicate event '" + event + "'");
    }
  }
  def->events_ = spec.events;

  // ---  3) Transitions ------------------------------------------------------
  def->transitions_.reserve(spec.transitions.size());
  for (const auto& t : spec.transitions) {
    const std::string where = machine + " " + transitionLabel(t);

    if (def->state_names_.count(t.from) == 0) {
      throw DefinitionError(where + ": undeclared source state '" + t.from +
                            "'");
    }
    if (def->state_names_.count(t.to) == 0) {
      throw DefinitionError(where + ": undeclared target state '" + t.to +
                            "'");
    }
    if (def->event_names_.count(t.event) == 0) {
      throw DefinitionError(where + ": undeclared event '" + t.event + "'");
    }
    if (def->terminal_states_.count(t.from) > 0) {
      throw DefinitionError(where + ": terminal state '" + t.from +
                            "' cannot have outgoing transitions");
    }

    Transition resolved;
    resolved.index = def->transitions_.size();
    resolved.from = t.from;
    resolved.event = t.event;
    resolved.to = t.to;
    resolved.guard_name = t.guard;
    if (!t.guard.empty()) {
      const Guard* guard = registry.guard(t.guard);
      if (guard == nullptr) {
        throw DefinitionError(where + ": unknown guard '" + t.guard + "'");
      }
      resolved.guard = *guard;
    }
    resolved.before_actions = resolveActions(t.before, registry, where);
    resolved.after_actions = resolveActions(t.after, registry, where);

    def->index_[{t.from, t.event}].push_back(resolved.index);
    def->transitions_.push_back(std::move(resolved));
  }

  return def;
}

std::shared_ptr<const StateMachineDefinition> defineMachine(
    const MachineSpec& spec, const ActionRegistry& registry) {
  return StateMachineDefinition::define(spec, registry);
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
bool StateMachineDefinition::hasState(const std::string& state) const {
  return state_names_.count(state) > 0;
}

bool StateMachineDefinition::isTerminal(const std::string& state) const {
  return terminal_states_.count(state) > 0;
}

bool StateMachineDefinition::hasEvent(const std::string& event) const {
  return event_names_.count(event) > 0;
}

std::vector<const Transition*> StateMachineDefinition::candidates(
    const std::string& from, const std::string& event) const {
  std::vector<const Transition*> result;
  auto it = index_.find({from, event});
  if (it == index_.end()) {
    return result;
  }
  result.reserve(it->second.size());
  for (std::size_t idx : it->second) {
    result.push_back(&transitions_[idx]);
  }
  return result;
}

std::vector<std::string> StateMachineDefinition::eventsFrom(
    const std::string& state) const {
  std::set<std::string> events;
  for (const auto& t : transitions_) {
    if (t.from == state) {
      events.insert(t.event);
    }
  }
  return {events.begin(), events.end()};
}

}  // namespace txflow
