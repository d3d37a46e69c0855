#ifndef TRACEFLOW_SERVICES_TRACE_SERVICE_HPP
#define TRACEFLOW_SERVICES_TRACE_SERVICE_HPP

#include <trace/trace_types.hpp>
#include <trace/cancellation.hpp>
#include <optional>
#include <string>
#include <vector>

namespace traceflow {

// Runs traces against the utility network.
// trace() is called from a worker thread and may block; implementations
// must poll the token and throw TraceError(Cancelled) once it is set.
class TraceService {
public:
    virtual ~TraceService() = default;

    // Throws TraceError on service, transport or authorization failure
    virtual std::vector<TraceResult> trace(const TraceRequest& request,
                                           const CancellationToken& token) = 0;

    // Default configuration of a tier, if the network defines it
    virtual std::optional<TraceConfiguration> default_trace_configuration(
        const std::string& domain_network,
        const std::string& tier) const = 0;
};

}  // namespace traceflow

#endif // TRACEFLOW_SERVICES_TRACE_SERVICE_HPP
