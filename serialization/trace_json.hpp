#ifndef TRACEFLOW_SERIALIZATION_TRACE_JSON_HPP
#define TRACEFLOW_SERIALIZATION_TRACE_JSON_HPP

#include <nlohmann/json.hpp>
#include <network/network_element.hpp>
#include <trace/trace_types.hpp>
#include "geometry_json.hpp"

namespace traceflow {

NLOHMANN_JSON_SERIALIZE_ENUM(PointType, {
    {PointType::Start, "start"},
    {PointType::Barrier, "barrier"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(TraceType, {
    {TraceType::Connected, "connected"},
    {TraceType::Subnetwork, "subnetwork"},
    {TraceType::Upstream, "upstream"},
    {TraceType::Downstream, "downstream"},
})

// TraceConfiguration serialization
inline void to_json(nlohmann::json& j, const TraceConfiguration& config) {
    j = {
        {"include_barriers", config.include_barriers},
        {"include_geometry", config.include_geometry},
        {"include_function_outputs", config.include_function_outputs}
    };
    if (!config.domain_network.empty()) j["domain_network"] = config.domain_network;
    if (!config.tier.empty()) j["tier"] = config.tier;
}

inline void from_json(const nlohmann::json& j, TraceConfiguration& config) {
    config.domain_network = j.value("domain_network", "");
    config.tier = j.value("tier", "");
    config.include_barriers = j.value("include_barriers", true);
    config.include_geometry = j.value("include_geometry", false);
    config.include_function_outputs = j.value("include_function_outputs", false);
}

// NetworkElement serialization (write only; elements are rebuilt by the element factory)
inline void to_json(nlohmann::json& j, const NetworkElement& element) {
    j = {
        {"global_id", element.global_id},
        {"object_id", element.object_id},
        {"source", element.source.name},
        {"kind", to_string(element.source.kind)}
    };
    if (!element.asset_type.name.empty()) {
        j["asset_type"] = element.asset_type.name;
    }
    if (element.fraction_along_edge) {
        j["fraction_along_edge"] = *element.fraction_along_edge;
    }
    if (element.terminal) {
        j["terminal"] = element.terminal->name;
    }
}

inline void to_json(nlohmann::json& j, const TracePoint& point) {
    j = point.element;
    j["type"] = point.type;
    if (point.location) {
        j["location"] = *point.location;
    }
}

// TraceResult variant serialization
inline nlohmann::json trace_result_to_json(const TraceResult& r) {
    return std::visit([](const auto& value) -> nlohmann::json {
        using T = std::decay_t<decltype(value)>;

        nlohmann::json j;
        if constexpr (std::is_same_v<T, result::ElementTraceResult>) {
            j["kind"] = "elements";
            j["elements"] = value.elements;
        } else if constexpr (std::is_same_v<T, result::GeometryTraceResult>) {
            j["kind"] = "geometry";
            j["points"] = value.points;
            j["lines"] = value.lines;
        } else if constexpr (std::is_same_v<T, result::FunctionTraceResult>) {
            j["kind"] = "function_outputs";
            j["outputs"] = nlohmann::json::object();
            for (const auto& output : value.outputs) {
                j["outputs"][output.name] = output.value;
            }
        }
        return j;
    }, r);
}

inline nlohmann::json trace_outcome_to_json(const TraceOutcome& outcome) {
    nlohmann::json j;
    j["results"] = nlohmann::json::array();
    for (const auto& r : outcome.results) {
        j["results"].push_back(trace_result_to_json(r));
    }
    j["elements_by_layer"] = nlohmann::json::object();
    for (const auto& [layer, elements] : outcome.elements_by_layer) {
        nlohmann::json ids = nlohmann::json::array();
        for (const auto& element : elements) {
            ids.push_back(element.global_id);
        }
        j["elements_by_layer"][layer] = ids;
    }
    j["element_count"] = outcome.element_count();
    if (outcome.error) {
        j["error"] = *outcome.error;
    }
    return j;
}

}  // namespace traceflow

#endif // TRACEFLOW_SERIALIZATION_TRACE_JSON_HPP
