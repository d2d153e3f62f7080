#pragma once

#include "txflow/concurrent/thread_safe_queue.hpp"
#include "txflow/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace txflow {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ telemetry and command gateway
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that publishes lifecycle telemetry on a
//         PUB socket and answers operator commands on a REP socket.
//
// @details
//   1. PUB socket: every Event pushed through pushTelemetry() is formatted
//      as one JSON object, e.g.
//        {"type":"transition_committed","machine":"transaction",
//         "entity_id":"tx-1","event":"depositing_via_api",
//         "from":"draft","to":"depositing","version":1,"timestamp_ms":...}
//      Events reach the server through a ThreadSafeQueue, so the thread
//      that called fire() never blocks on JSON formatting or socket I/O.
//
//   2. REP socket: each request string is handed to the command handler
//      (LifecycleEngine::executeCommand) and its JSON reply is sent back.
//      A handler exception becomes {"status":"error",...} so the client's
//      REQ socket is never left waiting. The worker polls the REP socket
//      with a short timeout and drains telemetry between polls, so stop()
//      is noticed within one poll interval.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any
//   thread. The command handler runs on the IPC thread and must be
//   thread-safe with respect to the rest of the engine.
//
// Ownership:
//   Owned by LifecycleEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when already running.
  // Throws zmq::error_t if an endpoint cannot be bound.
  void start();

  // Stops the worker after a final telemetry drain and closes the sockets.
  // Idempotent.
  void stop();

  // Queues an event for publication. Dropped once the server is stopped.
  void pushTelemetry(Event event);

  bool running() const { return running_.load(); }

  // JSON text published on the PUB socket for one event.
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr std::chrono::milliseconds kPollInterval{50};

  void run();
  void publishPending();
  void serveOneCommand();
  std::string handleCommand(const std::string& command);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace txflow
