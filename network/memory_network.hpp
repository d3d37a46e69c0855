#ifndef TRACEFLOW_NETWORK_MEMORY_NETWORK_HPP
#define TRACEFLOW_NETWORK_MEMORY_NETWORK_HPP

#include "network_definition.hpp"
#include <common/session.hpp>
#include <services/element_factory.hpp>
#include <services/identify_service.hpp>
#include <services/trace_service.hpp>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace traceflow {

using NodeIndex = size_t;

// Utility network held entirely in memory.
// Serves identify, element creation and traces for a loaded network file.
// All queries are read-only after load(), so traces may run on worker
// threads while the owner keeps identifying.
class InMemoryNetwork : public IdentifyService,
                        public ElementFactory,
                        public TraceService {
public:
    InMemoryNetwork(NetworkData data, const SessionContext& session);

    // Validate the data and build the connectivity index.
    // Throws TraceError(Unauthorized) for a secured network without a
    // credential, std::runtime_error for inconsistent data.
    void load();
    bool is_loaded() const { return loaded_; }

    const std::string& name() const { return data_.name; }
    const NetworkDefinition& definition() const { return data_.definition; }
    const std::vector<ElementRecord>& records() const { return data_.elements; }
    size_t association_count() const { return data_.associations.size(); }

    // Layer names in draw order (source order of the definition)
    std::vector<std::string> layer_names() const;

    const ElementRecord* record(const std::string& global_id) const;
    const ElementRecord* record(const std::string& source, ObjectId object_id) const;

    // IdentifyService
    std::vector<IdentifyLayerResult> identify(const ScreenPoint& screen_point,
                                              double tolerance) override;

    // Identify at a map location with a radius in map units
    std::vector<IdentifyLayerResult> identify_at(const Point& map_point, double radius) const;

    // ElementFactory
    std::optional<SourceKind> source_kind(const std::string& table_name) const override;
    std::optional<NetworkElement> make_element(const Feature& feature) const override;

    // TraceService
    std::vector<TraceResult> trace(const TraceRequest& request,
                                   const CancellationToken& token) override;
    std::optional<TraceConfiguration> default_trace_configuration(
        const std::string& domain_network,
        const std::string& tier) const override;

private:
    struct Link {
        NodeIndex neighbor;
        std::optional<TerminalId> local_terminal;
    };

    struct TraversalStart {
        NodeIndex node;
        std::optional<TerminalId> terminal;
    };

    void require_loaded() const;
    void require_credential() const;

    Feature feature_for(const ElementRecord& record) const;
    NetworkElement element_for(const ElementRecord& record) const;
    std::optional<TerminalId> terminal_id(const ElementRecord& record,
                                          const std::optional<std::string>& name) const;

    std::vector<TraversalStart> resolve_starts(const TraceRequest& request) const;
    std::unordered_set<NodeIndex> resolve_barriers(const TraceRequest& request) const;

    // Breadth-first traversal; accept decides whether a neighbor may be entered
    // from the current node. Barriers are reached but never expanded.
    template <typename Accept>
    std::vector<NodeIndex> traverse(const std::vector<TraversalStart>& starts,
                                    const std::unordered_set<NodeIndex>& barriers,
                                    bool include_barriers,
                                    const CancellationToken& token,
                                    Accept accept) const;

    // Hops from the nearest subnetwork controller, ignoring barriers
    std::vector<std::optional<size_t>> controller_distances() const;

    void simulate_latency(const CancellationToken& token) const;

    NetworkData data_;
    const SessionContext& session_;
    bool loaded_ = false;

    std::unordered_map<std::string, NodeIndex> by_global_id_;
    std::map<std::pair<std::string, ObjectId>, NodeIndex> by_feature_;
    std::vector<std::vector<Link>> adjacency_;
};

}  // namespace traceflow

#endif // TRACEFLOW_NETWORK_MEMORY_NETWORK_HPP
