#include "trace_types.hpp"
#include <cctype>
#include <type_traits>

namespace traceflow {

const char* to_string(PointType type) {
    switch (type) {
        case PointType::Start: return "start";
        case PointType::Barrier: return "barrier";
    }
    return "unknown";
}

std::optional<PointType> point_type_from_string(const std::string& name) {
    if (name == "start") return PointType::Start;
    if (name == "barrier") return PointType::Barrier;
    return std::nullopt;
}

const char* to_string(TraceType type) {
    switch (type) {
        case TraceType::Connected: return "connected";
        case TraceType::Subnetwork: return "subnetwork";
        case TraceType::Upstream: return "upstream";
        case TraceType::Downstream: return "downstream";
    }
    return "unknown";
}

std::optional<TraceType> trace_type_from_string(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    for (TraceType type : all_trace_types()) {
        if (lower == to_string(type)) {
            return type;
        }
    }
    return std::nullopt;
}

std::string display_name(TraceType type) {
    std::string name = to_string(type);
    if (!name.empty()) {
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    }
    return name;
}

const std::vector<TraceType>& all_trace_types() {
    static const std::vector<TraceType> types = {
        TraceType::Connected, TraceType::Subnetwork,
        TraceType::Upstream, TraceType::Downstream
    };
    return types;
}

const char* result_kind(const TraceResult& result) {
    return std::visit([](auto&& r) -> const char* {
        using T = std::decay_t<decltype(r)>;

        if constexpr (std::is_same_v<T, result::ElementTraceResult>) {
            return "elements";
        }
        else if constexpr (std::is_same_v<T, result::GeometryTraceResult>) {
            return "geometry";
        }
        else if constexpr (std::is_same_v<T, result::FunctionTraceResult>) {
            return "function_outputs";
        }
    }, result);
}

size_t TraceOutcome::element_count() const {
    size_t count = 0;
    for (const auto& [layer, elements] : elements_by_layer) {
        count += elements.size();
    }
    return count;
}

TraceOutcome make_outcome(std::vector<TraceResult> results) {
    TraceOutcome outcome;
    for (const auto& r : results) {
        if (const auto* elements = std::get_if<result::ElementTraceResult>(&r)) {
            for (auto& [layer, group] : group_by_source(elements->elements)) {
                auto& target = outcome.elements_by_layer[layer];
                target.insert(target.end(), group.begin(), group.end());
            }
        }
    }
    outcome.results = std::move(results);
    return outcome;
}

}  // namespace traceflow
