#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace txflow {

// -----------------------------------------------------------------------------
// StoredState
// -----------------------------------------------------------------------------
// The durable part of a state machine instance: its current state name and
// the number of commits applied so far.
// -----------------------------------------------------------------------------
struct StoredState {
  std::string state;
  std::uint64_t version{0};
};

// -----------------------------------------------------------------------------
// IStateStore: persistence collaborator contract
// -----------------------------------------------------------------------------
//
// @brief  The narrow interface the engine needs from the entity layer in
//         order to make a commit durable.
//
// @details
// The TransitionExecutor calls compareAndSet() inside the per-instance
// commit scope. A successful CAS is the durable commit point: only after it
// returns true does the instance publish the new state in memory and run
// after-actions. A false return means another writer (another process,
// another engine instance, or an operator fix-up) changed the record since
// the transition was resolved; the executor reports ConflictError and the
// caller may re-fire against the fresh state.
//
// Implementations backed by a database typically map compareAndSet() to
//   UPDATE ... SET state = :new, version = version + 1
//   WHERE id = :id AND state = :expected AND version = :expected_version
// inside the same transaction as any other entity writes.
//
// Thread model:
//   Implementations must be safe for concurrent calls. Calls for different
//   entity ids must not serialise on a single global lock.
//
// Ownership:
//   Borrowed by the TransitionExecutor (non-owning pointer). The owner
//   (LifecycleEngine or the embedding application) keeps it alive.
// -----------------------------------------------------------------------------
class IStateStore {
 public:
  virtual ~IStateStore() = default;

  // -------------------------------------------------------------------------
  // insert(entity_id, initial_state)
  // -------------------------------------------------------------------------
  // @brief  Creates the record for a new entity at version 0.
  //
  // @return false if a record for entity_id already exists (unchanged).
  // -------------------------------------------------------------------------
  virtual bool insert(const std::string& entity_id,
                      const std::string& initial_state) = 0;

  // Current durable record, or std::nullopt for an unknown entity.
  virtual std::optional<StoredState> load(
      const std::string& entity_id) const = 0;

  // -------------------------------------------------------------------------
  // compareAndSet(entity_id, expected_state, expected_version, new_state)
  // -------------------------------------------------------------------------
  // @brief  Atomically replaces the record's state and increments its
  //         version, but only if both still match the expected values.
  //
  // @return true on success; false on mismatch or unknown entity.
  // -------------------------------------------------------------------------
  virtual bool compareAndSet(const std::string& entity_id,
                             const std::string& expected_state,
                             std::uint64_t expected_version,
                             const std::string& new_state) = 0;
};

}  // namespace txflow
