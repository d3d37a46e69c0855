#ifndef TRACEFLOW_SERIALIZATION_CONFIG_JSON_HPP
#define TRACEFLOW_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <common/session.hpp>
#include "geometry_json.hpp"
#include "json_serialization.hpp"
#include "trace_json.hpp"
#include <stdexcept>
#include <string>

namespace traceflow {

// Credential serialization
inline void to_json(nlohmann::json& j, const Credential& credential) {
    // Passwords are never written back out
    j = {
        {"server", credential.server_url},
        {"username", credential.username}
    };
}

inline void from_json(const nlohmann::json& j, Credential& credential) {
    credential.server_url = j.at("server").get<std::string>();
    credential.username = j.value("username", "");
    credential.password = j.value("password", "");
}

// ViewpointConfig serialization
inline void to_json(nlohmann::json& j, const ViewpointConfig& viewpoint) {
    j = viewpoint.extent;
    j["width"] = viewpoint.width;
    j["height"] = viewpoint.height;
}

inline void from_json(const nlohmann::json& j, ViewpointConfig& viewpoint) {
    viewpoint.extent = j.get<Envelope>();
    viewpoint.width = j.value("width", 800.0);
    viewpoint.height = j.value("height", 520.0);
    if (viewpoint.width <= 0.0 || viewpoint.height <= 0.0) {
        throw std::runtime_error("viewpoint width and height must be positive");
    }
    if (viewpoint.extent.width() <= 0.0 || viewpoint.extent.height() <= 0.0) {
        throw std::runtime_error("viewpoint extent must not be empty");
    }
}

// SessionConfig serialization
inline void to_json(nlohmann::json& j, const SessionConfig& config) {
    nlohmann::json trace_types = nlohmann::json::array();
    for (TraceType type : config.trace_types) {
        trace_types.push_back(to_string(type));
    }
    j = {
        {"portal_url", config.portal_url},
        {"feature_service_url", config.feature_service_url},
        {"domain_network", config.domain_network},
        {"tier", config.tier},
        {"identify_tolerance", config.identify_tolerance},
        {"trace_types", trace_types},
        {"failure_policy", to_string(config.failure_policy)},
        {"viewpoint", config.viewpoint},
        {"trace_latency_ms", config.trace_latency.count()},
        {"credentials", config.credentials}
    };
}

inline void from_json(const nlohmann::json& j, SessionConfig& config) {
    SessionConfig defaults;
    config.portal_url = j.value("portal_url", defaults.portal_url);
    config.feature_service_url = j.value("feature_service_url", defaults.feature_service_url);
    config.domain_network = j.value("domain_network", defaults.domain_network);
    config.tier = j.value("tier", defaults.tier);
    config.identify_tolerance = j.value("identify_tolerance", defaults.identify_tolerance);
    if (config.identify_tolerance < 0.0) {
        throw std::runtime_error("identify_tolerance must not be negative");
    }

    config.trace_types = defaults.trace_types;
    if (j.contains("trace_types")) {
        config.trace_types.clear();
        for (const auto& name : j["trace_types"]) {
            auto type = trace_type_from_string(name.get<std::string>());
            if (!type) {
                throw std::runtime_error("Unknown trace type: " + name.get<std::string>());
            }
            config.trace_types.push_back(*type);
        }
    }

    config.failure_policy = defaults.failure_policy;
    if (j.contains("failure_policy")) {
        std::string name = j["failure_policy"].get<std::string>();
        auto policy = failure_policy_from_string(name);
        if (!policy) {
            throw std::runtime_error("Unknown failure policy: " + name);
        }
        config.failure_policy = *policy;
    }

    config.viewpoint = defaults.viewpoint;
    if (j.contains("viewpoint")) {
        config.viewpoint = j["viewpoint"].get<ViewpointConfig>();
    }

    config.trace_latency = std::chrono::milliseconds(j.value("trace_latency_ms", 0));
    config.credentials = j.value("credentials", std::vector<Credential>{});
}

// Load a session configuration file; a missing file is an error
inline SessionConfig load_session_config(const std::string& path) {
    return json::read_json_file(path).get<SessionConfig>();
}

}  // namespace traceflow

#endif // TRACEFLOW_SERIALIZATION_CONFIG_JSON_HPP
