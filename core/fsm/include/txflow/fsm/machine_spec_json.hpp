#pragma once

#include "txflow/fsm/machine_spec.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace txflow {

// -----------------------------------------------------------------------------
// MachineSpec JSON codec
// -----------------------------------------------------------------------------
// Document layout:
//
//   {"machines": [
//     {"name": "transaction",
//      "states": [{"name": "draft", "initial": true},
//                 {"name": "invested", "terminal": true}, ...],
//      "events": ["depositing_via_api", ...],
//      "transitions": [
//        {"from": "draft", "event": "depositing_via_api", "to": "depositing",
//         "guard": "", "before": [], "after": []}, ...]}]}
//
// "initial", "terminal", "guard", "before" and "after" are optional.
// A missing required key, a value of the wrong type or unparsable text
// raises DefinitionError naming the offending machine. Only the shape is
// checked here; the FSM rules are enforced by defineMachine().
// -----------------------------------------------------------------------------

MachineSpec machineSpecFromJson(const nlohmann::json& j);

nlohmann::json machineSpecToJson(const MachineSpec& spec);

// Parses a {"machines": [...]} document.
std::vector<MachineSpec> parseMachineSpecs(const std::string& text);

// Reads and parses a file. Throws DefinitionError if it cannot be opened.
std::vector<MachineSpec> loadMachineSpecs(const std::string& path);

}  // namespace txflow
