#ifndef TRACEFLOW_SERIALIZATION_NETWORK_JSON_HPP
#define TRACEFLOW_SERIALIZATION_NETWORK_JSON_HPP

#include <nlohmann/json.hpp>
#include <network/network_definition.hpp>
#include <network/network_element.hpp>
#include "geometry_json.hpp"
#include "trace_json.hpp"
#include <stdexcept>
#include <string>

namespace traceflow {

// NetworkSource serialization
inline void to_json(nlohmann::json& j, const NetworkSource& source) {
    j = {
        {"name", source.name},
        {"kind", to_string(source.kind)},
        {"layer_id", source.layer_id}
    };
}

inline void from_json(const nlohmann::json& j, NetworkSource& source) {
    source.name = j.at("name").get<std::string>();
    std::string kind = j.value("kind", "junction");
    auto parsed = source_kind_from_string(kind);
    if (!parsed) {
        throw std::runtime_error("Unknown source kind '" + kind + "' for source " + source.name);
    }
    source.kind = *parsed;
    source.layer_id = j.value("layer_id", 0);
}

inline void to_json(nlohmann::json& j, const Terminal& terminal) {
    j = {
        {"id", terminal.id},
        {"name", terminal.name}
    };
}

inline void from_json(const nlohmann::json& j, Terminal& terminal) {
    terminal.id = j.at("id").get<TerminalId>();
    terminal.name = j.at("name").get<std::string>();
}

// AssetType serialization; terminals may be given as plain names,
// which are numbered from 1 in order
inline void to_json(nlohmann::json& j, const AssetType& asset) {
    j = {{"name", asset.name}};
    if (asset.terminal_configuration) {
        j["terminal_configuration"] = asset.terminal_configuration->name;
        j["terminals"] = asset.terminal_configuration->terminals;
    }
}

inline void from_json(const nlohmann::json& j, AssetType& asset) {
    asset.name = j.at("name").get<std::string>();
    asset.terminal_configuration.reset();
    if (j.contains("terminals")) {
        TerminalConfiguration config;
        config.name = j.value("terminal_configuration", asset.name);
        TerminalId next_id = 1;
        for (const auto& t : j["terminals"]) {
            if (t.is_string()) {
                config.terminals.push_back({next_id++, t.get<std::string>()});
            } else {
                Terminal terminal = t.get<Terminal>();
                next_id = terminal.id + 1;
                config.terminals.push_back(terminal);
            }
        }
        asset.terminal_configuration = config;
    }
}

inline void to_json(nlohmann::json& j, const Tier& tier) {
    j = {
        {"name", tier.name},
        {"trace_configuration", tier.trace_configuration}
    };
}

inline void from_json(const nlohmann::json& j, Tier& tier) {
    tier.name = j.at("name").get<std::string>();
    if (j.contains("trace_configuration")) {
        tier.trace_configuration = j["trace_configuration"].get<TraceConfiguration>();
    }
}

inline void to_json(nlohmann::json& j, const DomainNetwork& domain) {
    j = {
        {"name", domain.name},
        {"tiers", domain.tiers}
    };
}

inline void from_json(const nlohmann::json& j, DomainNetwork& domain) {
    domain.name = j.at("name").get<std::string>();
    domain.tiers = j.value("tiers", std::vector<Tier>{});
}

inline void to_json(nlohmann::json& j, const ElementRecord& record) {
    j = {
        {"global_id", record.global_id},
        {"object_id", record.object_id},
        {"source", record.source}
    };
    if (!record.asset_type.empty()) j["asset_type"] = record.asset_type;
    if (!record.subnetwork.empty()) j["subnetwork"] = record.subnetwork;
    if (record.is_controller) j["controller"] = true;
    if (record.geometry) j["geometry"] = geometry_to_json(*record.geometry);
}

inline void from_json(const nlohmann::json& j, ElementRecord& record) {
    record.global_id = j.at("global_id").get<std::string>();
    record.object_id = j.at("object_id").get<ObjectId>();
    record.source = j.at("source").get<std::string>();
    record.asset_type = j.value("asset_type", "");
    record.subnetwork = j.value("subnetwork", "");
    record.is_controller = j.value("controller", false);
    if (j.contains("geometry")) {
        record.geometry = geometry_from_json(j["geometry"]);
    } else {
        record.geometry.reset();
    }
}

inline void to_json(nlohmann::json& j, const Association& association) {
    j = {
        {"from", association.from},
        {"to", association.to}
    };
    if (association.from_terminal) j["from_terminal"] = *association.from_terminal;
    if (association.to_terminal) j["to_terminal"] = *association.to_terminal;
}

inline void from_json(const nlohmann::json& j, Association& association) {
    association.from = j.at("from").get<std::string>();
    association.to = j.at("to").get<std::string>();
    association.from_terminal.reset();
    association.to_terminal.reset();
    if (j.contains("from_terminal") && !j["from_terminal"].is_null()) {
        association.from_terminal = j["from_terminal"].get<std::string>();
    }
    if (j.contains("to_terminal") && !j["to_terminal"].is_null()) {
        association.to_terminal = j["to_terminal"].get<std::string>();
    }
}

// Network file
inline nlohmann::json network_to_json(const NetworkData& network) {
    nlohmann::json j;
    j["name"] = network.name;
    j["service_url"] = network.service_url;
    j["secured"] = network.secured;
    j["sources"] = network.definition.sources;
    j["asset_types"] = network.definition.asset_types;
    j["domain_networks"] = network.definition.domain_networks;
    j["elements"] = network.elements;
    j["connectivity"] = network.associations;
    return j;
}

inline NetworkData network_from_json(const nlohmann::json& j) {
    NetworkData network;
    network.name = j.value("name", "");
    network.service_url = j.value("service_url", "");
    network.secured = j.value("secured", false);
    network.definition.sources = j.value("sources", std::vector<NetworkSource>{});
    network.definition.asset_types = j.value("asset_types", std::vector<AssetType>{});
    network.definition.domain_networks = j.value("domain_networks", std::vector<DomainNetwork>{});
    network.elements = j.value("elements", std::vector<ElementRecord>{});
    network.associations = j.value("connectivity", std::vector<Association>{});
    return network;
}

}  // namespace traceflow

#endif // TRACEFLOW_SERIALIZATION_NETWORK_JSON_HPP
