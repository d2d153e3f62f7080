#include "txflow/fsm/action_registry.hpp"

#include <stdexcept>
#include <utility>

namespace txflow {

void ActionRegistry::registerGuard(const std::string& name, Guard guard) {
  if (name.empty()) {
    throw std::invalid_argument("guard name must not be empty");
  }
  if (!guard) {
    throw std::invalid_argument("guard '" + name + "' has no function");
  }
  if (!guards_.emplace(name, std::move(guard)).second) {
    throw std::invalid_argument("guard '" + name + "' already registered");
  }
}

void ActionRegistry::registerAction(const std::string& name, Action action) {
  if (name.empty()) {
    throw std::invalid_argument("action name must not be empty");
  }
  if (!action) {
    throw std::invalid_argument("action '" + name + "' has no function");
  }
  if (!actions_.emplace(name, std::move(action)).second) {
    throw std::invalid_argument("action '" + name + "' already registered");
  }
}

bool ActionRegistry::hasGuard(const std::string& name) const {
  return guards_.count(name) > 0;
}

bool ActionRegistry::hasAction(const std::string& name) const {
  return actions_.count(name) > 0;
}

const Guard* ActionRegistry::guard(const std::string& name) const {
  auto it = guards_.find(name);
  return it == guards_.end() ? nullptr : &it->second;
}

const Action* ActionRegistry::action(const std::string& name) const {
  auto it = actions_.find(name);
  return it == actions_.end() ? nullptr : &it->second;
}

}  // namespace txflow
