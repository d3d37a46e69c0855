#ifndef TRACEFLOW_NETWORK_DEFINITION_HPP
#define TRACEFLOW_NETWORK_DEFINITION_HPP

#include "network_element.hpp"
#include <trace/trace_types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace traceflow {

struct Tier {
    std::string name;
    TraceConfiguration trace_configuration;
};

struct DomainNetwork {
    std::string name;
    std::vector<Tier> tiers;

    const Tier* tier(const std::string& tier_name) const;
};

// Schema of a utility network: its sources, asset types and tiers
struct NetworkDefinition {
    std::vector<NetworkSource> sources;
    std::vector<AssetType> asset_types;
    std::vector<DomainNetwork> domain_networks;

    const NetworkSource* source(const std::string& name) const;
    const AssetType* asset_type(const std::string& name) const;
    const DomainNetwork* domain_network(const std::string& name) const;
};

// One feature of the network as stored in the network file
struct ElementRecord {
    std::string global_id;
    ObjectId object_id = 0;
    std::string source;
    std::string asset_type;
    std::string subnetwork;
    bool is_controller = false;  // Subnetwork controller (flow source)
    std::optional<Geometry> geometry;
};

// Connectivity between two elements, optionally through named terminals
struct Association {
    std::string from;
    std::optional<std::string> from_terminal;
    std::string to;
    std::optional<std::string> to_terminal;
};

struct NetworkData {
    std::string name;
    std::string service_url;
    bool secured = false;
    NetworkDefinition definition;
    std::vector<ElementRecord> elements;
    std::vector<Association> associations;
};

}  // namespace traceflow

#endif // TRACEFLOW_NETWORK_DEFINITION_HPP
