#ifndef TRACEFLOW_SERIALIZATION_SCRIPT_JSON_HPP
#define TRACEFLOW_SERIALIZATION_SCRIPT_JSON_HPP

#include <nlohmann/json.hpp>
#include <trace/workflow_script.hpp>
#include "geometry_json.hpp"
#include "trace_json.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace traceflow {

// One step: {"action": "tap", "at": [x, y]}, {"action": "trace_type", "value": "upstream"}, ...
inline ScriptStep script_step_from_json(const nlohmann::json& j) {
    std::string action = j.at("action").get<std::string>();

    if (action == "start") {
        return step::Start{};
    } else if (action == "point_type") {
        std::string name = j.at("value").get<std::string>();
        auto type = point_type_from_string(name);
        if (!type) {
            throw std::runtime_error("Unknown point type: " + name);
        }
        return step::SetPointType{*type};
    } else if (action == "tap") {
        return step::Tap{j.at("at").get<Point>()};
    } else if (action == "select_terminal") {
        return step::SelectTerminal{j.at("index").get<size_t>()};
    } else if (action == "dismiss") {
        return step::DismissTerminal{};
    } else if (action == "next") {
        return step::Next{};
    } else if (action == "trace_type") {
        std::string name = j.at("value").get<std::string>();
        auto type = trace_type_from_string(name);
        if (!type) {
            throw std::runtime_error("Unknown trace type: " + name);
        }
        return step::SetTraceType{*type};
    } else if (action == "run") {
        return step::Run{};
    } else if (action == "wait") {
        step::Wait wait;
        wait.timeout = std::chrono::milliseconds(j.value("timeout_ms", 5000));
        return wait;
    } else if (action == "reset") {
        return step::Reset{};
    }

    throw std::runtime_error("Unknown script action: " + action);
}

inline std::vector<ScriptStep> script_from_json(const nlohmann::json& j) {
    const nlohmann::json& steps = j.is_array() ? j : j.at("steps");
    std::vector<ScriptStep> script;
    for (const auto& s : steps) {
        script.push_back(script_step_from_json(s));
    }
    return script;
}

}  // namespace traceflow

#endif // TRACEFLOW_SERIALIZATION_SCRIPT_JSON_HPP
