#ifndef TRACEFLOW_NETWORK_ELEMENT_HPP
#define TRACEFLOW_NETWORK_ELEMENT_HPP

#include <geometry/shapes.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace traceflow {

using ObjectId = int64_t;
using TerminalId = uint32_t;

enum class SourceKind {
    Junction,
    Edge
};

const char* to_string(SourceKind kind);
std::optional<SourceKind> source_kind_from_string(const std::string& name);

// A table of the network, one per operational layer
struct NetworkSource {
    std::string name;
    SourceKind kind = SourceKind::Junction;
    int layer_id = 0;
};

// Named connection point on a junction
struct Terminal {
    TerminalId id = 0;
    std::string name;

    bool operator==(const Terminal& other) const {
        return id == other.id && name == other.name;
    }
};

struct TerminalConfiguration {
    std::string name;
    std::vector<Terminal> terminals;
};

struct AssetType {
    std::string name;
    std::optional<TerminalConfiguration> terminal_configuration;

    size_t terminal_count() const {
        return terminal_configuration ? terminal_configuration->terminals.size() : 0;
    }
};

// Reference to a feature within the network's logical graph
struct NetworkElement {
    std::string global_id;
    ObjectId object_id = 0;
    NetworkSource source;
    AssetType asset_type;

    // Edge elements only; [0,1] along the edge geometry
    std::optional<double> fraction_along_edge;

    // Junction elements with several terminals only
    std::optional<Terminal> terminal;

    bool is_edge() const { return source.kind == SourceKind::Edge; }
    bool is_junction() const { return source.kind == SourceKind::Junction; }
};

// Map feature found by identify; table_name names its network source
struct Feature {
    ObjectId object_id = 0;
    std::string table_name;
    std::optional<Geometry> geometry;
    std::map<std::string, std::string> attributes;
};

// Group elements by the name of their network source (the layer they highlight in)
std::map<std::string, std::vector<NetworkElement>> group_by_source(
    const std::vector<NetworkElement>& elements);

}  // namespace traceflow

#endif // TRACEFLOW_NETWORK_ELEMENT_HPP
