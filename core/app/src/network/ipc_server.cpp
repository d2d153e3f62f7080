#include "txflow/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace txflow {

namespace {

using nlohmann::json;

json toJson(const TransitionCommittedEvent& e) {
  return {{"type", "transition_committed"},
          {"machine", e.machine},
          {"entity_id", e.entity_id},
          {"event", e.event},
          {"from", e.from_state},
          {"to", e.to_state},
          {"version", e.version},
          {"timestamp_ms", e.timestamp_ms}};
}

json toJson(const TransitionRejectedEvent& e) {
  return {{"type", "transition_rejected"},
          {"machine", e.machine},
          {"entity_id", e.entity_id},
          {"event", e.event},
          {"from", e.from_state},
          {"kind", e.kind},
          {"reason", e.reason},
          {"timestamp_ms", e.timestamp_ms}};
}

json toJson(const ActionFailedEvent& e) {
  return {{"type", "action_failed"},
          {"machine", e.machine},
          {"entity_id", e.entity_id},
          {"event", e.event},
          {"action", e.action},
          {"phase", e.phase},
          {"message", e.message},
          {"failed_children", e.failed_children},
          {"timestamp_ms", e.timestamp_ms}};
}

json toJson(const BroadcastCompletedEvent& e) {
  return {{"type", "broadcast_completed"},
          {"parent_id", e.parent_id},
          {"event", e.event},
          {"attempted", e.attempted},
          {"succeeded", e.succeeded},
          {"failed_children", e.failed_children},
          {"timestamp_ms", e.timestamp_ms}};
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  auto context = std::make_unique<zmq::context_t>(1);
  auto rep = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::rep);
  auto pub = std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pub);
  rep->set(zmq::sockopt::linger, 0);
  pub->set(zmq::sockopt::linger, 0);

  // Bind before publishing the members so a failed bind leaves the server
  // stopped and restartable.
  rep->bind(cmd_endpoint_);
  pub->bind(pub_endpoint_);

  context_ = std::move(context);
  cmd_socket_ = std::move(rep);
  pub_socket_ = std::move(pub);

  telemetry_queue_.reopen();
  running_.store(true);
  thread_ = std::thread(&IpcServer::run, this);

  std::cout << "[IpcServer] listening. commands on " << cmd_endpoint_
            << ", telemetry on " << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  telemetry_queue_.close();
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  // Sockets before the context; zmq::context_t blocks on open sockets.
  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  // A closed queue drops the event; telemetry is best effort.
  telemetry_queue_.push(std::move(event));
}

std::string IpcServer::formatTelemetry(const Event& event) {
  return std::visit([](const auto& e) { return toJson(e).dump(); }, event);
}

// -----------------------------------------------------------------------------
// run(): poll the REP socket, publish queued telemetry between polls
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    publishPending();

    zmq::pollitem_t item{cmd_socket_->handle(), 0, ZMQ_POLLIN, 0};
    try {
      zmq::poll(&item, 1, kPollInterval);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[IpcServer] poll failed: " << e.what() << "\n";
      break;
    }

    if (item.revents & ZMQ_POLLIN) {
      serveOneCommand();
    }
  }

  // Events queued before stop() still go out.
  publishPending();
}

void IpcServer::publishPending() {
  while (auto event = telemetry_queue_.try_pop()) {
    const std::string payload = formatTelemetry(*event);
    pub_socket_->send(zmq::buffer(payload), zmq::send_flags::dontwait);
  }
}

void IpcServer::serveOneCommand() {
  zmq::message_t request;
  if (!cmd_socket_->recv(request, zmq::recv_flags::dontwait)) {
    return;
  }

  const std::string reply = handleCommand(request.to_string());
  cmd_socket_->send(zmq::buffer(reply), zmq::send_flags::none);
}

std::string IpcServer::handleCommand(const std::string& command) {
  try {
    return command_handler_(command);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command '" << command << "' failed: "
              << e.what() << "\n";
    return json{{"status", "error"}, {"response", e.what()}}.dump();
  }
}

}  // namespace txflow
