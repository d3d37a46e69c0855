#include "network_element.hpp"

namespace traceflow {

const char* to_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::Junction: return "junction";
        case SourceKind::Edge: return "edge";
    }
    return "unknown";
}

std::optional<SourceKind> source_kind_from_string(const std::string& name) {
    if (name == "junction") return SourceKind::Junction;
    if (name == "edge") return SourceKind::Edge;
    return std::nullopt;
}

std::map<std::string, std::vector<NetworkElement>> group_by_source(
    const std::vector<NetworkElement>& elements) {
    std::map<std::string, std::vector<NetworkElement>> groups;
    for (const auto& element : elements) {
        groups[element.source.name].push_back(element);
    }
    return groups;
}

}  // namespace traceflow
