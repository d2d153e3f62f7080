#include "txflow/fsm/state_machine_instance.hpp"

#include "txflow/fsm/transition_executor.hpp"
#include "txflow/persistence/i_state_store.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

namespace txflow {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
StateMachineInstance::StateMachineInstance(
    std::string entity_id,
    std::shared_ptr<const StateMachineDefinition> definition,
    TransitionExecutor& executor, std::string initial_state,
    std::uint64_t initial_version, std::size_t history_capacity)
    : entity_id_(std::move(entity_id)),
      definition_(std::move(definition)),
      executor_(executor),
      history_capacity_(history_capacity),
      state_(std::move(initial_state)),
      version_(initial_version) {
  if (!definition_) {
    throw std::invalid_argument("instance needs a definition");
  }
  if (entity_id_.empty()) {
    throw std::invalid_argument("entity id must not be empty");
  }
  if (!definition_->hasState(state_)) {
    throw std::invalid_argument("state '" + state_ + "' is not declared by " +
                                definition_->name());
  }
}

// -----------------------------------------------------------------------------
// Snapshot reads
// -----------------------------------------------------------------------------
std::string StateMachineInstance::currentState() const {
  std::shared_lock lock(mutex_);
  return state_;
}

std::uint64_t StateMachineInstance::version() const {
  std::shared_lock lock(mutex_);
  return version_;
}

StateSnapshot StateMachineInstance::snapshot() const {
  std::shared_lock lock(mutex_);
  return StateSnapshot{state_, version_};
}

bool StateMachineInstance::isTerminal() const {
  return definition_->isTerminal(currentState());
}

std::vector<std::string> StateMachineInstance::availableEvents() const {
  return definition_->eventsFrom(currentState());
}

std::vector<TransitionRecord> StateMachineInstance::history() const {
  std::shared_lock lock(mutex_);
  return {history_.begin(), history_.end()};
}

bool StateMachineInstance::canFire(const std::string& event,
                                   const TransitionContext& context) const {
  return executor_.canFire(*this, event, context);
}

FireResult StateMachineInstance::fire(const std::string& event,
                                      const TransitionContext& context) {
  return executor_.fire(*this, event, context);
}

// -----------------------------------------------------------------------------
// applyCommitLocked(): publish the committed state in memory
// -----------------------------------------------------------------------------
void StateMachineInstance::applyCommitLocked(const std::string& event,
                                             const std::string& to,
                                             std::int64_t timestamp_ms) {
  TransitionRecord record{state_, event, to, version_ + 1, timestamp_ms};
  state_ = to;
  ++version_;

  if (history_capacity_ == 0) {
    return;
  }
  history_.push_back(std::move(record));
  while (history_.size() > history_capacity_) {
    history_.pop_front();
  }
}

// -----------------------------------------------------------------------------
// bindInstance()
// -----------------------------------------------------------------------------
std::shared_ptr<StateMachineInstance> bindInstance(
    std::shared_ptr<const StateMachineDefinition> definition,
    const std::string& entity_id, TransitionExecutor& executor,
    const std::optional<std::string>& initial_state_override,
    std::size_t history_capacity) {
  if (!definition) {
    throw std::invalid_argument("bindInstance: null definition");
  }
  if (initial_state_override && !definition->hasState(*initial_state_override)) {
    throw std::invalid_argument("bindInstance: '" + *initial_state_override +
                                "' is not a state of " + definition->name());
  }

  std::string state =
      initial_state_override.value_or(definition->initialState());
  std::uint64_t version = 0;

  if (IStateStore* store = executor.store()) {
    if (auto stored = store->load(entity_id)) {
      if (initial_state_override) {
        throw std::invalid_argument("bindInstance: " + entity_id +
                                    " already persisted; override refused");
      }
      state = stored->state;
      version = stored->version;
    } else if (!store->insert(entity_id, state)) {
      // Lost an insert race with another binder; take what it stored.
      auto winner = store->load(entity_id);
      if (!winner) {
        throw std::runtime_error("bindInstance: store lost record for " +
                                 entity_id);
      }
      state = winner->state;
      version = winner->version;
    }
  }

  return std::make_shared<StateMachineInstance>(
      entity_id, std::move(definition), executor, std::move(state), version,
      history_capacity);
}

FireResult fire(StateMachineInstance& instance, const std::string& event,
                const TransitionContext& context) {
  return instance.fire(event, context);
}

}  // namespace txflow
