#pragma once

#include "txflow/jobs/i_job_queue.hpp"

#include <zmq.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace txflow {

// -----------------------------------------------------------------------------
// ZmqJobQueue: IJobQueue over a ZeroMQ PUSH socket
// -----------------------------------------------------------------------------
//
// @brief  Ships jobs as JSON to external workers (PULL sockets) so that
//         after-actions such as "start_next_transfer" are executed outside
//         the engine process.
//
// @details
// Wire format, one JSON object per ZMQ message:
//   {"type":"start_next_transfer","entity_id":"tx-1",
//    "commit_version":2,"payload":{...}}
//
// The socket is bound in the constructor. PUSH blocks when no worker is
// connected, so sends use ZMQ_SNDTIMEO (kSendTimeoutMs): a job that cannot
// be handed over in time raises std::runtime_error, which surfaces as an
// after-phase ActionError instead of stalling the committing thread.
//
// Thread model:
//   ZeroMQ sockets are not thread-safe; enqueue() serialises access with a
//   mutex so any thread (callers of fire(), the ActionDispatcher worker)
//   may use it.
//
// Ownership:
//   Owns its context and socket. Owned by LifecycleEngine via unique_ptr.
// -----------------------------------------------------------------------------
class ZmqJobQueue final : public IJobQueue {
 public:
  static constexpr int kSendTimeoutMs = 200;

  // Binds a PUSH socket on endpoint (e.g. "tcp://127.0.0.1:5560").
  // Throws zmq::error_t if the endpoint cannot be bound.
  explicit ZmqJobQueue(const std::string& endpoint);
  ~ZmqJobQueue() override;

  ZmqJobQueue(const ZmqJobQueue&) = delete;
  ZmqJobQueue& operator=(const ZmqJobQueue&) = delete;

  void enqueue(Job job) override;

  // JSON encoding used on the wire.
  static std::string formatJob(const Job& job);

 private:
  std::string endpoint_;
  std::mutex socket_mutex_;
  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace txflow
