#pragma once

#include "txflow/persistence/i_state_store.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace txflow {

// -----------------------------------------------------------------------------
// InMemoryStateStore: process-local IStateStore
// -----------------------------------------------------------------------------
//
// @brief  Reference implementation of the persistence contract, used by the
//         demo executable, the LifecycleEngine default wiring and the tests.
//
// @details
// Records live in a map of heap-allocated Record objects, each with its own
// mutex. The map itself is guarded by a std::shared_mutex that is taken
// exclusively only by insert(); load() and compareAndSet() take it shared
// to find the record and then lock just that record. CAS traffic on
// different entities therefore never contends.
//
// Records are never erased, so a Record pointer obtained under the shared
// lock stays valid after the lock is released.
// -----------------------------------------------------------------------------
class InMemoryStateStore final : public IStateStore {
 public:
  InMemoryStateStore() = default;

  InMemoryStateStore(const InMemoryStateStore&) = delete;
  InMemoryStateStore& operator=(const InMemoryStateStore&) = delete;

  bool insert(const std::string& entity_id,
              const std::string& initial_state) override;

  std::optional<StoredState> load(const std::string& entity_id) const override;

  bool compareAndSet(const std::string& entity_id,
                     const std::string& expected_state,
                     std::uint64_t expected_version,
                     const std::string& new_state) override;

  // -------------------------------------------------------------------------
  // overwrite(entity_id, state)
  // -------------------------------------------------------------------------
  // @brief  Out-of-band write that bumps the version without a CAS check.
  //
  // @details
  // Stands in for a second writer (another process or a manual repair) so
  // tests can provoke a ConflictError on the next commit.
  //
  // @return false for an unknown entity.
  // -------------------------------------------------------------------------
  bool overwrite(const std::string& entity_id, const std::string& state);

  std::size_t size() const;

 private:
  struct Record {
    mutable std::mutex mutex;
    StoredState value;
  };

  Record* find(const std::string& entity_id) const;

  mutable std::shared_mutex map_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Record>> records_;
};

}  // namespace txflow
