#include "txflow/persistence/in_memory_state_store.hpp"

namespace txflow {

// -----------------------------------------------------------------------------
// insert()
// -----------------------------------------------------------------------------
bool InMemoryStateStore::insert(const std::string& entity_id,
                                const std::string& initial_state) {
  std::unique_lock lock(map_mutex_);
  auto [it, inserted] = records_.try_emplace(entity_id);
  if (!inserted) {
    return false;
  }
  it->second = std::make_unique<Record>();
  it->second->value.state = initial_state;
  it->second->value.version = 0;
  return true;
}

// -----------------------------------------------------------------------------
// load()
// -----------------------------------------------------------------------------
std::optional<StoredState> InMemoryStateStore::load(
    const std::string& entity_id) const {
  const Record* record = find(entity_id);
  if (record == nullptr) {
    return std::nullopt;
  }
  std::lock_guard lock(record->mutex);
  return record->value;
}

// -----------------------------------------------------------------------------
// compareAndSet()
// -----------------------------------------------------------------------------
bool InMemoryStateStore::compareAndSet(const std::string& entity_id,
                                       const std::string& expected_state,
                                       std::uint64_t expected_version,
                                       const std::string& new_state) {
  Record* record = find(entity_id);
  if (record == nullptr) {
    return false;
  }
  std::lock_guard lock(record->mutex);
  if (record->value.state != expected_state ||
      record->value.version != expected_version) {
    return false;
  }
  record->value.state = new_state;
  ++record->value.version;
  return true;
}

// -----------------------------------------------------------------------------
// overwrite()
// -----------------------------------------------------------------------------
bool InMemoryStateStore::overwrite(const std::string& entity_id,
                                   const std::string& state) {
  Record* record = find(entity_id);
  if (record == nullptr) {
    return false;
  }
  std::lock_guard lock(record->mutex);
  record->value.state = state;
  ++record->value.version;
  return true;
}

// -----------------------------------------------------------------------------
// size()
// -----------------------------------------------------------------------------
std::size_t InMemoryStateStore::size() const {
  std::shared_lock lock(map_mutex_);
  return records_.size();
}

// -----------------------------------------------------------------------------
// find(): shared map lookup; the Record outlives the lock (never erased)
// -----------------------------------------------------------------------------
InMemoryStateStore::Record* InMemoryStateStore::find(
    const std::string& entity_id) const {
  std::shared_lock lock(map_mutex_);
  auto it = records_.find(entity_id);
  return (it != records_.end()) ? it->second.get() : nullptr;
}

}  // namespace txflow
