#pragma once

#include "txflow/fsm/fire_result.hpp"
#include "txflow/fsm/state_machine_definition.hpp"
#include "txflow/fsm/transition_context.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace txflow {

class TransitionExecutor;

// One committed transition, as kept in the instance history.
struct TransitionRecord {
  std::string from;
  std::string event;
  std::string to;
  std::uint64_t version{0};  // Instance version after this commit
  std::int64_t timestamp_ms{0};
};

// Consistent (state, version) pair read under one lock.
struct StateSnapshot {
  std::string state;
  std::uint64_t version{0};
};

// -----------------------------------------------------------------------------
// StateMachineInstance
// -----------------------------------------------------------------------------
//
// @brief  Runtime binding of one entity (e.g. transaction "tx-1") to the
//         shared StateMachineDefinition of its type.
//
// @details
// The instance owns the entity's current state, its commit version and a
// bounded history of committed transitions. Only the TransitionExecutor
// writes them (it is a friend); everybody else reads snapshots.
//
// fire() and canFire() delegate to the executor the instance was bound
// with. Instances are always owned by std::shared_ptr (bindInstance()
// creates them that way) because asynchronous after-actions and the
// HierarchicalBridge keep them alive beyond the caller's scope.
//
// Thread model:
//   Reads take the per-instance std::shared_mutex shared. The executor
//   takes it exclusive only around the commit. Instances never share a
//   lock, so fires on different entities do not contend.
// -----------------------------------------------------------------------------
class StateMachineInstance
    : public std::enable_shared_from_this<StateMachineInstance> {
 public:
  static constexpr std::size_t kDefaultHistoryCapacity = 64;

  // Throws std::invalid_argument if `definition` is null, `entity_id` is
  // empty or `initial_state` is not declared by the definition.
  StateMachineInstance(std::string entity_id,
                       std::shared_ptr<const StateMachineDefinition> definition,
                       TransitionExecutor& executor,
                       std::string initial_state,
                       std::uint64_t initial_version = 0,
                       std::size_t history_capacity = kDefaultHistoryCapacity);

  StateMachineInstance(const StateMachineInstance&) = delete;
  StateMachineInstance& operator=(const StateMachineInstance&) = delete;

  const std::string& id() const { return entity_id_; }
  const StateMachineDefinition& definition() const { return *definition_; }
  const std::shared_ptr<const StateMachineDefinition>& sharedDefinition()
      const {
    return definition_;
  }
  TransitionExecutor& executor() const { return executor_; }

  std::string currentState() const;
  std::uint64_t version() const;
  StateSnapshot snapshot() const;
  bool isTerminal() const;

  // Events with at least one transition out of the current state. Guards
  // are not evaluated.
  std::vector<std::string> availableEvents() const;

  // Oldest first, at most history_capacity entries.
  std::vector<TransitionRecord> history() const;

  // True when some candidate from the current state has a passing guard.
  // Runs no actions and changes nothing.
  bool canFire(const std::string& event,
               const TransitionContext& context = {}) const;

  // The only way to change the state. See TransitionExecutor::fire().
  FireResult fire(const std::string& event,
                  const TransitionContext& context = {});

 private:
  friend class TransitionExecutor;

  // Caller holds mutex_ exclusively.
  void applyCommitLocked(const std::string& event, const std::string& to,
                         std::int64_t timestamp_ms);

  const std::string entity_id_;
  const std::shared_ptr<const StateMachineDefinition> definition_;
  TransitionExecutor& executor_;
  const std::size_t history_capacity_;

  mutable std::shared_mutex mutex_;
  std::string state_;
  std::uint64_t version_{0};
  std::deque<TransitionRecord> history_;
};

// -----------------------------------------------------------------------------
// bindInstance(definition, entity_id, executor, initial_state_override)
// -----------------------------------------------------------------------------
//
// @brief  Creates the instance for an entity and registers it with the
//         executor's state store, if one is attached.
//
// @details
// Without a store the instance starts in the override (if given) or the
// definition's initial state at version 0.
//
// With a store:
//   - no record yet: the record is inserted with the starting state above;
//   - record exists, no override: the instance is hydrated from the stored
//     (state, version), which is how an entity is re-bound after a restart;
//   - record exists and an override is given: std::invalid_argument, since
//     the override would silently diverge from durable state.
//
// Throws std::invalid_argument when the override is not a declared state.
// -----------------------------------------------------------------------------
std::shared_ptr<StateMachineInstance> bindInstance(
    std::shared_ptr<const StateMachineDefinition> definition,
    const std::string& entity_id, TransitionExecutor& executor,
    const std::optional<std::string>& initial_state_override = std::nullopt,
    std::size_t history_capacity =
        StateMachineInstance::kDefaultHistoryCapacity);

// Free-function form of StateMachineInstance::fire().
FireResult fire(StateMachineInstance& instance, const std::string& event,
                const TransitionContext& context = {});

}  // namespace txflow
