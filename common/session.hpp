#ifndef TRACEFLOW_COMMON_SESSION_HPP
#define TRACEFLOW_COMMON_SESSION_HPP

#include <geometry/shapes.hpp>
#include <geometry/viewport.hpp>
#include <trace/trace_types.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace traceflow {

// What the workflow does after a failed trace
enum class FailurePolicy {
    ShowEmptyResults,  // ViewingResults with an empty outcome
    ReturnToIdle
};

const char* to_string(FailurePolicy policy);
std::optional<FailurePolicy> failure_policy_from_string(const std::string& name);

// Username/password token credential for one server
struct Credential {
    std::string server_url;
    std::string username;
    std::string password;
};

// Credentials available to the services of a session.
// Lookups may come from trace worker threads.
class CredentialStore {
public:
    void add(Credential credential);

    // Credential whose server URL prefixes the given URL
    std::optional<Credential> find(const std::string& url) const;

    void remove_all();
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<Credential> credentials_;
};

struct ViewpointConfig {
    Envelope extent{-9813547.35557238, 5129980.36635111, -9813185.0602376, 5130215.41254146};
    double width = 800.0;
    double height = 520.0;
};

struct SessionConfig {
    std::string portal_url = "https://sampleserver7.arcgisonline.com/portal/sharing/rest";
    std::string feature_service_url =
        "https://sampleserver7.arcgisonline.com/server/rest/services/UtilityNetwork/NapervilleElectric/FeatureServer";

    // Tier whose default trace configuration is applied to every trace
    std::string domain_network = "ElectricDistribution";
    std::string tier = "Medium Voltage Radial";

    // Identify tolerance in pixels
    double identify_tolerance = 10.0;

    std::vector<TraceType> trace_types = all_trace_types();
    FailurePolicy failure_policy = FailurePolicy::ShowEmptyResults;
    ViewpointConfig viewpoint;

    // Artificial delay of the in-memory trace service
    std::chrono::milliseconds trace_latency{0};

    std::vector<Credential> credentials;
};

// Explicit replacement for a process-wide SDK environment: owns the
// configuration and credentials and is passed to everything that needs them.
class SessionContext {
public:
    SessionContext() : SessionContext(SessionConfig{}) {}
    explicit SessionContext(SessionConfig config);

    SessionContext(const SessionContext&) = delete;
    SessionContext& operator=(const SessionContext&) = delete;

    const SessionConfig& config() const { return config_; }
    CredentialStore& credentials() { return credentials_; }
    const CredentialStore& credentials() const { return credentials_; }

    MapViewport viewport() const;

    bool supports(TraceType type) const;

    // Forget all credentials (end of session)
    void close();

private:
    SessionConfig config_;
    CredentialStore credentials_;
};

}  // namespace traceflow

#endif // TRACEFLOW_COMMON_SESSION_HPP
