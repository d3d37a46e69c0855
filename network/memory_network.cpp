#include "memory_network.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <deque>
#include <stdexcept>
#include <thread>

namespace traceflow {

InMemoryNetwork::InMemoryNetwork(NetworkData data, const SessionContext& session)
    : data_(std::move(data)), session_(session) {}

void InMemoryNetwork::load() {
    auto log = logging::get_logger();

    require_credential();

    by_global_id_.clear();
    by_feature_.clear();
    adjacency_.assign(data_.elements.size(), {});

    for (NodeIndex i = 0; i < data_.elements.size(); ++i) {
        const ElementRecord& record = data_.elements[i];
        if (record.global_id.empty()) {
            throw std::runtime_error("Network element without global id (object id " +
                                     std::to_string(record.object_id) + ")");
        }
        if (!by_global_id_.emplace(record.global_id, i).second) {
            throw std::runtime_error("Duplicate network element: " + record.global_id);
        }
        if (!data_.definition.source(record.source)) {
            throw std::runtime_error("Element " + record.global_id +
                                     " references unknown source: " + record.source);
        }
        if (!record.asset_type.empty() && !data_.definition.asset_type(record.asset_type)) {
            throw std::runtime_error("Element " + record.global_id +
                                     " references unknown asset type: " + record.asset_type);
        }
        if (!by_feature_.emplace(std::make_pair(record.source, record.object_id), i).second) {
            throw std::runtime_error("Duplicate object id " + std::to_string(record.object_id) +
                                     " in source " + record.source);
        }
    }

    for (const auto& association : data_.associations) {
        auto from = by_global_id_.find(association.from);
        auto to = by_global_id_.find(association.to);
        if (from == by_global_id_.end() || to == by_global_id_.end()) {
            throw std::runtime_error("Association references unknown element: " +
                                     association.from + " -> " + association.to);
        }
        auto from_terminal = terminal_id(data_.elements[from->second], association.from_terminal);
        auto to_terminal = terminal_id(data_.elements[to->second], association.to_terminal);

        adjacency_[from->second].push_back({to->second, from_terminal});
        adjacency_[to->second].push_back({from->second, to_terminal});
    }

    loaded_ = true;
    log->info("Loaded network '{}': {} elements, {} associations",
              data_.name, data_.elements.size(), data_.associations.size());
}

std::vector<std::string> InMemoryNetwork::layer_names() const {
    std::vector<std::string> names;
    for (const auto& source : data_.definition.sources) {
        names.push_back(source.name);
    }
    return names;
}

const ElementRecord* InMemoryNetwork::record(const std::string& global_id) const {
    auto it = by_global_id_.find(global_id);
    return it == by_global_id_.end() ? nullptr : &data_.elements[it->second];
}

const ElementRecord* InMemoryNetwork::record(const std::string& source, ObjectId object_id) const {
    auto it = by_feature_.find(std::make_pair(source, object_id));
    return it == by_feature_.end() ? nullptr : &data_.elements[it->second];
}

std::vector<IdentifyLayerResult> InMemoryNetwork::identify(const ScreenPoint& screen_point,
                                                           double tolerance) {
    require_loaded();
    MapViewport viewport = session_.viewport();
    Point map_point = viewport.to_map(screen_point);
    return identify_at(map_point, tolerance * viewport.units_per_pixel());
}

std::vector<IdentifyLayerResult> InMemoryNetwork::identify_at(const Point& map_point,
                                                              double radius) const {
    struct Hit {
        double distance;
        NodeIndex node;
    };
    std::map<std::string, std::vector<Hit>> hits;

    for (NodeIndex i = 0; i < data_.elements.size(); ++i) {
        const ElementRecord& r = data_.elements[i];
        if (!r.geometry) {
            continue;
        }
        double d = distance_to(*r.geometry, map_point);
        if (d <= radius) {
            hits[r.source].push_back({d, i});
        }
    }

    struct LayerHits {
        std::string layer;
        double nearest;
        bool junction;
        std::vector<Hit> hits;
    };
    std::vector<LayerHits> layers;
    for (auto& [layer, layer_hits] : hits) {
        std::sort(layer_hits.begin(), layer_hits.end(),
                  [](const Hit& a, const Hit& b) { return a.distance < b.distance; });
        const NetworkSource* source = data_.definition.source(layer);
        bool junction = source && source->kind == SourceKind::Junction;
        layers.push_back({layer, layer_hits.front().distance, junction, std::move(layer_hits)});
    }

    // Nearest layer first; junctions draw above edges on ties
    std::sort(layers.begin(), layers.end(), [](const LayerHits& a, const LayerHits& b) {
        if (a.nearest != b.nearest) return a.nearest < b.nearest;
        return a.junction && !b.junction;
    });

    std::vector<IdentifyLayerResult> results;
    for (const auto& layer : layers) {
        IdentifyLayerResult result;
        result.layer_name = layer.layer;
        for (const auto& hit : layer.hits) {
            result.features.push_back(feature_for(data_.elements[hit.node]));
        }
        results.push_back(std::move(result));
    }
    return results;
}

std::optional<SourceKind> InMemoryNetwork::source_kind(const std::string& table_name) const {
    const NetworkSource* source = data_.definition.source(table_name);
    if (!source) {
        return std::nullopt;
    }
    return source->kind;
}

std::optional<NetworkElement> InMemoryNetwork::make_element(const Feature& feature) const {
    const ElementRecord* r = record(feature.table_name, feature.object_id);
    if (!r) {
        return std::nullopt;
    }
    return element_for(*r);
}

std::vector<TraceResult> InMemoryNetwork::trace(const TraceRequest& request,
                                                const CancellationToken& token) {
    auto log = logging::get_logger();

    require_loaded();
    require_credential();

    if (request.starting_locations.empty()) {
        throw TraceError(TraceErrorKind::InvalidRequest, "Trace requires at least one starting location");
    }

    std::vector<TraversalStart> starts = resolve_starts(request);
    std::unordered_set<NodeIndex> barriers = resolve_barriers(request);
    TraceConfiguration config = request.configuration.value_or(TraceConfiguration{});

    log->debug("Tracing {} from {} start(s) with {} barrier(s)",
               to_string(request.type), starts.size(), barriers.size());

    simulate_latency(token);
    token.throw_if_cancelled();

    std::vector<NodeIndex> reached;
    switch (request.type) {
        case TraceType::Connected: {
            reached = traverse(starts, barriers, config.include_barriers, token,
                               [](NodeIndex, NodeIndex) { return true; });
            break;
        }
        case TraceType::Subnetwork: {
            std::unordered_set<std::string> subnetworks;
            for (const auto& start : starts) {
                const std::string& name = data_.elements[start.node].subnetwork;
                if (!name.empty()) {
                    subnetworks.insert(name);
                }
            }
            if (subnetworks.empty()) {
                throw TraceError(TraceErrorKind::Service,
                                 "Starting locations are not part of a subnetwork");
            }
            reached = traverse(starts, barriers, config.include_barriers, token,
                [&](NodeIndex, NodeIndex to) {
                    return subnetworks.count(data_.elements[to].subnetwork) > 0;
                });
            break;
        }
        case TraceType::Upstream:
        case TraceType::Downstream: {
            std::vector<std::optional<size_t>> distance = controller_distances();
            bool any_controller = std::any_of(data_.elements.begin(), data_.elements.end(),
                [](const ElementRecord& r) { return r.is_controller; });
            if (!any_controller) {
                throw TraceError(TraceErrorKind::Service,
                                 "Network has no subnetwork controller to orient the trace");
            }
            bool upstream = request.type == TraceType::Upstream;
            reached = traverse(starts, barriers, config.include_barriers, token,
                [&](NodeIndex from, NodeIndex to) {
                    if (!distance[from] || !distance[to]) {
                        return false;
                    }
                    return upstream ? *distance[to] < *distance[from]
                                    : *distance[to] > *distance[from];
                });
            break;
        }
    }

    token.throw_if_cancelled();

    std::vector<TraceResult> results;

    result::ElementTraceResult elements;
    for (NodeIndex node : reached) {
        elements.elements.push_back(element_for(data_.elements[node]));
    }
    size_t element_count = elements.elements.size();
    results.push_back(std::move(elements));

    double edge_length = 0.0;
    if (config.include_geometry || config.include_function_outputs) {
        result::GeometryTraceResult geometry;
        for (NodeIndex node : reached) {
            const auto& g = data_.elements[node].geometry;
            if (!g) {
                continue;
            }
            if (const auto* point = std::get_if<Point>(&*g)) {
                geometry.points.push_back(*point);
            } else {
                const auto& line = std::get<Polyline>(*g);
                edge_length += line.length();
                geometry.lines.push_back(line);
            }
        }
        if (config.include_geometry) {
            results.push_back(std::move(geometry));
        }
    }

    if (config.include_function_outputs) {
        result::FunctionTraceResult functions;
        functions.outputs.push_back({"element_count", static_cast<double>(element_count)});
        functions.outputs.push_back({"edge_length", edge_length});
        results.push_back(std::move(functions));
    }

    log->debug("Trace {} reached {} element(s)", to_string(request.type), element_count);
    return results;
}

std::optional<TraceConfiguration> InMemoryNetwork::default_trace_configuration(
    const std::string& domain_network,
    const std::string& tier) const {
    const DomainNetwork* domain = data_.definition.domain_network(domain_network);
    if (!domain) {
        return std::nullopt;
    }
    const Tier* t = domain->tier(tier);
    if (!t) {
        return std::nullopt;
    }
    TraceConfiguration config = t->trace_configuration;
    config.domain_network = domain->name;
    config.tier = t->name;
    return config;
}

void InMemoryNetwork::require_loaded() const {
    if (!loaded_) {
        throw TraceError(TraceErrorKind::Service, "Network '" + data_.name + "' is not loaded");
    }
}

void InMemoryNetwork::require_credential() const {
    if (data_.secured && !session_.credentials().find(data_.service_url)) {
        throw TraceError(TraceErrorKind::Unauthorized,
                         "No credential available for " + data_.service_url);
    }
}

Feature InMemoryNetwork::feature_for(const ElementRecord& record) const {
    Feature feature;
    feature.object_id = record.object_id;
    feature.table_name = record.source;
    feature.geometry = record.geometry;
    feature.attributes["GLOBALID"] = record.global_id;
    if (!record.asset_type.empty()) {
        feature.attributes["ASSETTYPE"] = record.asset_type;
    }
    if (!record.subnetwork.empty()) {
        feature.attributes["SUBNETWORKNAME"] = record.subnetwork;
    }
    return feature;
}

NetworkElement InMemoryNetwork::element_for(const ElementRecord& record) const {
    NetworkElement element;
    element.global_id = record.global_id;
    element.object_id = record.object_id;
    if (const NetworkSource* source = data_.definition.source(record.source)) {
        element.source = *source;
    }
    if (const AssetType* asset = data_.definition.asset_type(record.asset_type)) {
        element.asset_type = *asset;
    } else {
        element.asset_type.name = record.asset_type;
    }
    return element;
}

std::optional<TerminalId> InMemoryNetwork::terminal_id(const ElementRecord& record,
                                                       const std::optional<std::string>& name) const {
    if (!name) {
        return std::nullopt;
    }
    const AssetType* asset = data_.definition.asset_type(record.asset_type);
    if (asset && asset->terminal_configuration) {
        for (const auto& terminal : asset->terminal_configuration->terminals) {
            if (terminal.name == *name) {
                return terminal.id;
            }
        }
    }
    throw std::runtime_error("Element " + record.global_id + " has no terminal named " + *name);
}

std::vector<InMemoryNetwork::TraversalStart> InMemoryNetwork::resolve_starts(
    const TraceRequest& request) const {
    std::vector<TraversalStart> starts;
    for (const auto& element : request.starting_locations) {
        auto it = by_global_id_.find(element.global_id);
        if (it == by_global_id_.end()) {
            throw TraceError(TraceErrorKind::InvalidRequest,
                             "Unknown starting location: " + element.global_id);
        }
        std::optional<TerminalId> terminal;
        if (element.terminal) {
            terminal = element.terminal->id;
        }
        starts.push_back({it->second, terminal});
    }
    return starts;
}

std::unordered_set<NodeIndex> InMemoryNetwork::resolve_barriers(const TraceRequest& request) const {
    std::unordered_set<NodeIndex> barriers;
    for (const auto& element : request.barriers) {
        auto it = by_global_id_.find(element.global_id);
        if (it == by_global_id_.end()) {
            throw TraceError(TraceErrorKind::InvalidRequest,
                             "Unknown barrier: " + element.global_id);
        }
        barriers.insert(it->second);
    }
    return barriers;
}

template <typename Accept>
std::vector<NodeIndex> InMemoryNetwork::traverse(const std::vector<TraversalStart>& starts,
                                                 const std::unordered_set<NodeIndex>& barriers,
                                                 bool include_barriers,
                                                 const CancellationToken& token,
                                                 Accept accept) const {
    std::vector<NodeIndex> order;
    std::vector<bool> visited(data_.elements.size(), false);
    std::deque<TraversalStart> queue;

    for (const auto& start : starts) {
        if (visited[start.node]) {
            continue;
        }
        visited[start.node] = true;
        order.push_back(start.node);
        if (barriers.count(start.node) == 0) {
            queue.push_back(start);
        }
    }

    while (!queue.empty()) {
        token.throw_if_cancelled();

        TraversalStart current = queue.front();
        queue.pop_front();

        for (const Link& link : adjacency_[current.node]) {
            // A start on a specific terminal only leaves through that terminal
            if (current.terminal && link.local_terminal && *link.local_terminal != *current.terminal) {
                continue;
            }
            NodeIndex next = link.neighbor;
            if (visited[next] || !accept(current.node, next)) {
                continue;
            }
            visited[next] = true;
            if (barriers.count(next) > 0) {
                if (include_barriers) {
                    order.push_back(next);
                }
                continue;
            }
            order.push_back(next);
            queue.push_back({next, std::nullopt});
        }
    }

    return order;
}

std::vector<std::optional<size_t>> InMemoryNetwork::controller_distances() const {
    std::vector<std::optional<size_t>> distance(data_.elements.size());
    std::deque<NodeIndex> queue;

    for (NodeIndex i = 0; i < data_.elements.size(); ++i) {
        if (data_.elements[i].is_controller) {
            distance[i] = 0;
            queue.push_back(i);
        }
    }

    while (!queue.empty()) {
        NodeIndex current = queue.front();
        queue.pop_front();
        for (const Link& link : adjacency_[current]) {
            if (!distance[link.neighbor]) {
                distance[link.neighbor] = *distance[current] + 1;
                queue.push_back(link.neighbor);
            }
        }
    }

    return distance;
}

void InMemoryNetwork::simulate_latency(const CancellationToken& token) const {
    auto remaining = session_.config().trace_latency;
    const auto slice = std::chrono::milliseconds(5);
    while (remaining.count() > 0) {
        token.throw_if_cancelled();
        auto step = std::min(remaining, slice);
        std::this_thread::sleep_for(step);
        remaining -= step;
    }
}

}  // namespace traceflow
