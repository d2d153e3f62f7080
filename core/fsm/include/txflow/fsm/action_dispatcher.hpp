#pragma once

#include "txflow/concurrent/thread_safe_queue.hpp"
#include "txflow/eventbus/event_bus.hpp"
#include "txflow/fsm/i_action_scheduler.hpp"
#include "txflow/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace txflow {

// -----------------------------------------------------------------------------
// ActionDispatcher
// -----------------------------------------------------------------------------
//
// @brief  IActionScheduler that runs after-action batches on one owned
//         worker thread.
//
// @details
// The committing thread pushes the batch into a ThreadSafeQueue and returns
// from fire() immediately; the worker pops batches in FIFO order and runs
// each batch's actions in declaration order through
// TransitionExecutor::runAfterActions(). Failures are logged and published
// as ActionFailedEvent (phase "After") on the EventBus, if one is attached.
//
// De-duplication: a batch is keyed by "<entity id>#<commit version>". A key
// already accepted within the last kDedupWindow batches is counted in
// duplicateCount() and dropped, so a commit handed over twice still runs
// its actions once. Action handlers must nevertheless tolerate being run
// again after a process restart.
//
// Thread model:
//   schedule() from any thread, including the worker itself (a broadcast
//   action firing children that have after-actions of their own).
//   start()/stop() from the owning thread. stop() closes the queue and
//   joins after every accepted batch has run.
//
// Ownership:
//   Owned by LifecycleEngine (or a test). Batches hold shared_ptrs to
//   their instances, keeping them alive until the batch has run.
// -----------------------------------------------------------------------------
class ActionDispatcher final : public IActionScheduler {
 public:
  static constexpr std::size_t kDedupWindow = 4096;

  explicit ActionDispatcher(const ITimeProvider& clock,
                            EventBus* bus = nullptr);

  // Stops and joins the worker.
  ~ActionDispatcher() override;

  ActionDispatcher(const ActionDispatcher&) = delete;
  ActionDispatcher& operator=(const ActionDispatcher&) = delete;
  ActionDispatcher(ActionDispatcher&&) = delete;
  ActionDispatcher& operator=(ActionDispatcher&&) = delete;

  // Spawns the worker. No-op when already running.
  void start();

  // Drains the queue, then joins. Idempotent.
  void stop();

  // Returns false when the dispatcher is not running; the executor then
  // runs the batch inline.
  bool schedule(AfterActionBatch batch) override;

  // -------------------------------------------------------------------------
  // waitIdle(timeout)
  // -------------------------------------------------------------------------
  // @brief  Blocks until no accepted batch is queued or running, including
  //         batches scheduled by batches that were running.
  //
  // @return true if idle was reached before the timeout.
  // -------------------------------------------------------------------------
  bool waitIdle(std::chrono::milliseconds timeout);

  bool running() const { return running_.load(); }

  // Batches whose actions have been run.
  std::size_t dispatchedCount() const { return dispatched_.load(); }

  // Batches dropped because their commit had already been accepted.
  std::size_t duplicateCount() const { return duplicates_.load(); }

 private:
  void run();
  void process(AfterActionBatch& batch);

  // Records the key; false if it was already in the window.
  bool remember(const std::string& key);

  const ITimeProvider& clock_;
  EventBus* bus_;

  ThreadSafeQueue<AfterActionBatch> queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};

  std::mutex dedup_mutex_;
  std::unordered_set<std::string> seen_;
  std::deque<std::string> seen_order_;

  std::mutex idle_mutex_;
  std::condition_variable idle_cv_;
  std::size_t pending_{0};

  std::atomic<std::size_t> dispatched_{0};
  std::atomic<std::size_t> duplicates_{0};
};

}  // namespace txflow
