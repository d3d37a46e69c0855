#ifndef TRACEFLOW_TRACE_TYPES_HPP
#define TRACEFLOW_TRACE_TYPES_HPP

#include <network/network_element.hpp>
#include <geometry/shapes.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace traceflow {

enum class PointType {
    Start,
    Barrier
};

enum class TraceType {
    Connected,
    Subnetwork,
    Upstream,
    Downstream
};

const char* to_string(PointType type);
std::optional<PointType> point_type_from_string(const std::string& name);

const char* to_string(TraceType type);
std::optional<TraceType> trace_type_from_string(const std::string& name);

// Capitalized name for pickers ("Upstream")
std::string display_name(TraceType type);

// All trace types in picker order
const std::vector<TraceType>& all_trace_types();

// Rules applied by the trace service on top of the trace type
struct TraceConfiguration {
    std::string domain_network;
    std::string tier;
    bool include_barriers = true;
    bool include_geometry = false;
    bool include_function_outputs = false;
};

struct TracePoint {
    PointType type = PointType::Start;
    NetworkElement element;
    std::optional<Point> location;  // Where the marker is drawn
};

struct TraceRequest {
    TraceType type = TraceType::Connected;
    std::vector<NetworkElement> starting_locations;
    std::vector<NetworkElement> barriers;
    std::optional<TraceConfiguration> configuration;
};

namespace result {

struct ElementTraceResult {
    std::vector<NetworkElement> elements;
};

struct GeometryTraceResult {
    std::vector<Point> points;
    std::vector<Polyline> lines;
};

struct FunctionOutput {
    std::string name;
    double value = 0.0;
};

struct FunctionTraceResult {
    std::vector<FunctionOutput> outputs;
};

}  // namespace result

using TraceResult = std::variant<
    result::ElementTraceResult,
    result::GeometryTraceResult,
    result::FunctionTraceResult
>;

const char* result_kind(const TraceResult& result);

// What the workflow keeps after a trace completes
struct TraceOutcome {
    std::vector<TraceResult> results;
    std::map<std::string, std::vector<NetworkElement>> elements_by_layer;
    std::optional<std::string> error;

    size_t element_count() const;
    bool empty() const { return elements_by_layer.empty(); }
};

// Partition the element results of a trace by source layer
TraceOutcome make_outcome(std::vector<TraceResult> results);

}  // namespace traceflow

#endif // TRACEFLOW_TRACE_TYPES_HPP
