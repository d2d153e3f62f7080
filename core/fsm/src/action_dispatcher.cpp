#include "txflow/fsm/action_dispatcher.hpp"

#include "txflow/fsm/state_machine_instance.hpp"
#include "txflow/fsm/transition_executor.hpp"

#include <iostream>
#include <utility>

namespace txflow {

ActionDispatcher::ActionDispatcher(const ITimeProvider& clock, EventBus* bus)
    : clock_(clock), bus_(bus) {}

ActionDispatcher::~ActionDispatcher() { stop(); }

// -----------------------------------------------------------------------------
// start(): reopen the queue and spawn the worker
// -----------------------------------------------------------------------------
void ActionDispatcher::start() {
  if (running_.exchange(true)) {
    return;
  }
  queue_.reopen();
  thread_ = std::thread([this] { run(); });
  std::cout << "[ActionDispatcher] started.\n";
}

// -----------------------------------------------------------------------------
// stop(): close, drain, join
// -----------------------------------------------------------------------------
void ActionDispatcher::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  // Batches already queued are still run; pop() returns nullopt only once
  // the closed queue is empty.
  queue_.close();
  if (thread_.joinable()) {
    thread_.join();
  }
  std::cout << "[ActionDispatcher] stopped after " << dispatched_.load()
            << " batch(es), " << duplicates_.load() << " duplicate(s).\n";
}

// -----------------------------------------------------------------------------
// schedule()
// -----------------------------------------------------------------------------
bool ActionDispatcher::schedule(AfterActionBatch batch) {
  if (!running_.load() || !batch.instance) {
    return false;
  }

  const std::string key =
      batch.instance->id() + "#" + std::to_string(batch.commit_version);
  if (!remember(key)) {
    duplicates_.fetch_add(1);
    return true;
  }

  {
    std::lock_guard lock(idle_mutex_);
    ++pending_;
  }
  if (!queue_.push(std::move(batch))) {
    // Closed between the running_ check and the push.
    {
      std::lock_guard lock(idle_mutex_);
      --pending_;
    }
    idle_cv_.notify_all();
    std::lock_guard lock(dedup_mutex_);
    seen_.erase(key);
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// waitIdle()
// -----------------------------------------------------------------------------
bool ActionDispatcher::waitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(idle_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] { return pending_ == 0; });
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void ActionDispatcher::run() {
  while (auto batch = queue_.pop()) {
    process(*batch);
    dispatched_.fetch_add(1);
    {
      std::lock_guard lock(idle_mutex_);
      --pending_;
    }
    idle_cv_.notify_all();
  }
}

void ActionDispatcher::process(AfterActionBatch& batch) {
  StateMachineInstance& instance = *batch.instance;
  batch.context.commit_version = batch.commit_version;
  const auto failures = TransitionExecutor::runAfterActions(
      instance, batch.actions, batch.context);

  for (const auto& failure : failures) {
    std::cerr << "[ActionDispatcher] after-action '" << failure.action
              << "' failed for " << instance.id() << " v"
              << batch.commit_version << " (" << batch.from_state << " -> "
              << batch.to_state << "): " << failure.message << "\n";
    if (bus_ != nullptr) {
      bus_->publish(TransitionExecutor::makeActionFailedEvent(
          instance, batch.event, failure, clock_.now_ms()));
    }
  }
}

// -----------------------------------------------------------------------------
// remember(): bounded de-duplication window
// -----------------------------------------------------------------------------
bool ActionDispatcher::remember(const std::string& key) {
  std::lock_guard lock(dedup_mutex_);
  if (!seen_.insert(key).second) {
    return false;
  }
  seen_order_.push_back(key);
  while (seen_order_.size() > kDedupWindow) {
    seen_.erase(seen_order_.front());
    seen_order_.pop_front();
  }
  return true;
}

}  // namespace txflow
