#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace txflow {

// -----------------------------------------------------------------------------
// Job
// -----------------------------------------------------------------------------
// A unit of background work requested by an after-action, e.g. "start the
// next transfer for transaction tx-1". The engine only guarantees that the
// job is handed to the queue at least once per commit; executing it (and
// retrying it) is the worker's business.
//
// (entity_id, type, commit_version) identifies the commit that requested
// the job. Workers use it to drop duplicates.
// -----------------------------------------------------------------------------
struct Job {
  std::string type;                 // e.g. "start_next_transfer"
  std::string entity_id;            // Instance whose commit requested it
  std::uint64_t commit_version{0};  // Instance version of that commit
  nlohmann::json payload = nlohmann::json::object();
};

// -----------------------------------------------------------------------------
// IJobQueue: background job collaborator
// -----------------------------------------------------------------------------
//
// @brief  Where after-actions send work that must not run inside fire().
//
// @details
// enqueue() reports failure by throwing (e.g. the transport is down). When
// called from an after-action the TransitionExecutor turns that into a
// non-fatal after-phase ActionError: the transition stays committed and the
// caller knows the follow-up job still has to be requested.
//
// Thread model: implementations must accept enqueue() from any thread.
// -----------------------------------------------------------------------------
class IJobQueue {
 public:
  virtual ~IJobQueue() = default;

  virtual void enqueue(Job job) = 0;
};

// -----------------------------------------------------------------------------
// InMemoryJobQueue: records jobs for inspection
// -----------------------------------------------------------------------------
// Used by tests and by LifecycleEngine when no job endpoint is configured.
// Jobs are kept in enqueue order until clear() is called.
// -----------------------------------------------------------------------------
class InMemoryJobQueue final : public IJobQueue {
 public:
  void enqueue(Job job) override {
    std::lock_guard lock(mutex_);
    jobs_.push_back(std::move(job));
  }

  // Snapshot of every job enqueued so far.
  std::vector<Job> jobs() const {
    std::lock_guard lock(mutex_);
    return jobs_;
  }

  // Jobs of one type, in enqueue order.
  std::vector<Job> jobsOfType(const std::string& type) const {
    std::lock_guard lock(mutex_);
    std::vector<Job> result;
    for (const auto& job : jobs_) {
      if (job.type == type) {
        result.push_back(job);
      }
    }
    return result;
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return jobs_.size();
  }

  void clear() {
    std::lock_guard lock(mutex_);
    jobs_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Job> jobs_;
};

}  // namespace txflow
