#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace txflow {

// -----------------------------------------------------------------------------
// EngineConfig: LifecycleEngine wiring parameters
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct copied into LifecycleEngine at construction.
//
// @details
// Every field has a default, so `EngineConfig{}` is a complete
// configuration: in-process job queue, inline after-actions, no IPC and
// the built-in lifecycle machines. Tests use that; the demo executable
// reads config/lifecycle.json through loadEngineConfig().
//
// An empty endpoint disables the corresponding socket.
//
// JSON layout (every key optional):
//   {"ipc_cmd_endpoint": "tcp://127.0.0.1:5556",
//    "ipc_pub_endpoint": "tcp://127.0.0.1:5557",
//    "job_endpoint": "",
//    "async_after_actions": true,
//    "history_capacity": 64,
//    "default_timeout_ms": 0,
//    "machine_config_path": ""}
// -----------------------------------------------------------------------------
struct EngineConfig {
  /// REP socket for PING / STATUS / FIRE commands. Both IPC endpoints must
  /// be non-empty for the IpcServer to be created.
  std::string ipc_cmd_endpoint;

  /// PUB socket for lifecycle telemetry.
  std::string ipc_pub_endpoint;

  /// PUSH socket for background jobs. Empty selects InMemoryJobQueue.
  std::string job_endpoint;

  /// Run after-actions on the ActionDispatcher thread instead of inside
  /// fire().
  bool async_after_actions{false};

  /// Per-instance transition history length.
  std::size_t history_capacity{64};

  /// Applied by LifecycleEngine::fire() when the caller's context has no
  /// timeout. 0 means unbounded.
  std::int64_t default_timeout_ms{0};

  /// Machine document (see machine_spec_json.hpp) overriding the built-in
  /// lifecycle specs. Empty uses the built-in specs.
  std::string machine_config_path;
};

// Missing keys keep their defaults. Throws nlohmann::json::exception on a
// value of the wrong type.
EngineConfig engineConfigFromJson(const nlohmann::json& j);

nlohmann::json engineConfigToJson(const EngineConfig& config);

// Reads a JSON file. Throws std::runtime_error if it cannot be opened and
// nlohmann::json::exception if it cannot be parsed.
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace txflow
