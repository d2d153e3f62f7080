#include "txflow/fsm/machine_spec_json.hpp"

#include "txflow/fsm/errors.hpp"

#include <fstream>
#include <sstream>

namespace txflow {

namespace {

std::vector<std::string> stringList(const nlohmann::json& j,
                                    const char* key) {
  if (!j.contains(key)) {
    return {};
  }
  return j.at(key).get<std::vector<std::string>>();
}

}  // namespace

// -----------------------------------------------------------------------------
// machineSpecFromJson()
// -----------------------------------------------------------------------------
MachineSpec machineSpecFromJson(const nlohmann::json& j) {
  const std::string label =
      j.is_object() && j.contains("name") && j["name"].is_string()
          ? j["name"].get<std::string>()
          : std::string("<unnamed>");

  try {
    MachineSpec spec;
    spec.name = j.at("name").get<std::string>();

    for (const auto& s : j.at("states")) {
      StateSpec state;
      state.name = s.at("name").get<std::string>();
      state.initial = s.value("initial", false);
      state.terminal = s.value("terminal", false);
      spec.states.push_back(std::move(state));
    }

    spec.events = j.at("events").get<std::vector<std::string>>();

    for (const auto& t : j.at("transitions")) {
      TransitionSpec transition;
      transition.from = t.at("from").get<std::string>();
      transition.event = t.at("event").get<std::string>();
      transition.to = t.at("to").get<std::string>();
      transition.guard = t.value("guard", std::string());
      transition.before = stringList(t, "before");
      transition.after = stringList(t, "after");
      spec.transitions.push_back(std::move(transition));
    }
    return spec;
  } catch (const nlohmann::json::exception& e) {
    throw DefinitionError("machine " + label + ": " + e.what());
  }
}

// -----------------------------------------------------------------------------
// machineSpecToJson()
// -----------------------------------------------------------------------------
nlohmann::json machineSpecToJson(const MachineSpec& spec) {
  nlohmann::json j;
  j["name"] = spec.name;

  nlohmann::json states = nlohmann::json::array();
  for (const auto& s : spec.states) {
    nlohmann::json state;
    state["name"] = s.name;
    if (s.initial) {
      state["initial"] = true;
    }
    if (s.terminal) {
      state["terminal"] = true;
    }
    states.push_back(std::move(state));
  }
  j["states"] = std::move(states);
  j["events"] = spec.events;

  nlohmann::json transitions = nlohmann::json::array();
  for (const auto& t : spec.transitions) {
    nlohmann::json transition;
    transition["from"] = t.from;
    transition["event"] = t.event;
    transition["to"] = t.to;
    transition["guard"] = t.guard;
    transition["before"] = t.before;
    transition["after"] = t.after;
    transitions.push_back(std::move(transition));
  }
  j["transitions"] = std::move(transitions);
  return j;
}

// -----------------------------------------------------------------------------
// parseMachineSpecs() / loadMachineSpecs()
// -----------------------------------------------------------------------------
std::vector<MachineSpec> parseMachineSpecs(const std::string& text) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw DefinitionError(std::string("unparsable machine document: ") +
                          e.what());
  }

  if (!doc.is_object() || !doc.contains("machines") ||
      !doc["machines"].is_array()) {
    throw DefinitionError("machine document needs a \"machines\" array");
  }

  std::vector<MachineSpec> specs;
  for (const auto& m : doc["machines"]) {
    specs.push_back(machineSpecFromJson(m));
  }
  return specs;
}

std::vector<MachineSpec> loadMachineSpecs(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw DefinitionError("cannot open machine document " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parseMachineSpecs(buffer.str());
}

}  // namespace txflow
