#include "txflow/jobs/zmq_job_queue.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace txflow {

// -----------------------------------------------------------------------------
// Constructor: create context and bind the PUSH socket
// -----------------------------------------------------------------------------
ZmqJobQueue::ZmqJobQueue(const std::string& endpoint) : endpoint_(endpoint) {
  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::push);
  socket_->set(zmq::sockopt::sndtimeo, kSendTimeoutMs);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->bind(endpoint_);

  std::cout << "[ZmqJobQueue] PUSH bound on " << endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// Destructor: socket before context
// -----------------------------------------------------------------------------
ZmqJobQueue::~ZmqJobQueue() {
  socket_.reset();
  context_.reset();
}

// -----------------------------------------------------------------------------
// enqueue(): serialise and send; a timed-out send is a failed hand-over
// -----------------------------------------------------------------------------
void ZmqJobQueue::enqueue(Job job) {
  std::string wire = formatJob(job);
  zmq::message_t msg(wire.data(), wire.size());

  zmq::send_result_t sent;
  {
    std::lock_guard lock(socket_mutex_);
    sent = socket_->send(msg, zmq::send_flags::none);
  }

  if (!sent.has_value()) {
    throw std::runtime_error("job queue " + endpoint_ +
                             " did not accept job '" + job.type +
                             "' for " + job.entity_id +
                             " (no worker connected)");
  }
}

// -----------------------------------------------------------------------------
// formatJob()
// -----------------------------------------------------------------------------
std::string ZmqJobQueue::formatJob(const Job& job) {
  nlohmann::json j;
  j["type"] = job.type;
  j["entity_id"] = job.entity_id;
  j["commit_version"] = job.commit_version;
  j["payload"] = job.payload;
  return j.dump();
}

}  // namespace txflow
