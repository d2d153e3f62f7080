#include "txflow/config/engine_config.hpp"

#include <fstream>
#include <stdexcept>

namespace txflow {

EngineConfig engineConfigFromJson(const nlohmann::json& j) {
  EngineConfig config;
  config.ipc_cmd_endpoint =
      j.value("ipc_cmd_endpoint", config.ipc_cmd_endpoint);
  config.ipc_pub_endpoint =
      j.value("ipc_pub_endpoint", config.ipc_pub_endpoint);
  config.job_endpoint = j.value("job_endpoint", config.job_endpoint);
  config.async_after_actions =
      j.value("async_after_actions", config.async_after_actions);
  config.history_capacity =
      j.value("history_capacity", config.history_capacity);
  config.default_timeout_ms =
      j.value("default_timeout_ms", config.default_timeout_ms);
  config.machine_config_path =
      j.value("machine_config_path", config.machine_config_path);
  return config;
}

nlohmann::json engineConfigToJson(const EngineConfig& config) {
  nlohmann::json j;
  j["ipc_cmd_endpoint"] = config.ipc_cmd_endpoint;
  j["ipc_pub_endpoint"] = config.ipc_pub_endpoint;
  j["job_endpoint"] = config.job_endpoint;
  j["async_after_actions"] = config.async_after_actions;
  j["history_capacity"] = config.history_capacity;
  j["default_timeout_ms"] = config.default_timeout_ms;
  j["machine_config_path"] = config.machine_config_path;
  return j;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw std::runtime_error("cannot open engine config " + path);
  }
  return engineConfigFromJson(nlohmann::json::parse(file));
}

}  // namespace txflow
