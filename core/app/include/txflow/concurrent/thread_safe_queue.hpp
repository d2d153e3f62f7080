#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace txflow {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>: closable multi-producer / multi-consumer FIFO
// -----------------------------------------------------------------------------
//
// @brief  Hands work items across thread boundaries: after-action batches
//         from committing threads to the ActionDispatcher worker, and
//         telemetry events from caller threads to the IpcServer thread.
//
// @details
// pop() blocks until an item is available or the queue is closed. Once
// close() has been called, producers can no longer add items and pop()
// keeps returning the remaining items in FIFO order; when the queue is both
// closed and empty pop() returns std::nullopt. This lets a worker loop be
// written as `while (auto item = queue.pop()) { ... }` and still drain every
// accepted item on shutdown.
//
// reopen() makes a closed queue accept items again, so a component that
// owns a queue can be stopped and started more than once.
//
// Thread model:
//   All methods are safe to call concurrently from any thread.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // @brief  Appends one item and wakes one waiting consumer.
  //
  // @return true if the item was accepted, false if the queue is closed
  //         (the item is dropped).
  // -------------------------------------------------------------------------
  bool push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // @brief  Removes and returns the front item, waiting for one if needed.
  //
  // @return The front item, or std::nullopt once the queue is closed and
  //         fully drained.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Non-blocking variant of pop(): std::nullopt when nothing is queued.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // close()
  // -------------------------------------------------------------------------
  // @brief  Stops accepting new items and wakes every blocked consumer.
  //
  // @details
  // Items already queued stay available to pop()/try_pop(). Idempotent.
  // -------------------------------------------------------------------------
  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    condition_.notify_all();
  }

  // Accept items again after close(). Queued items are kept.
  void reopen() {
    std::lock_guard lock(mutex_);
    closed_ = false;
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace txflow
