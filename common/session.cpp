#include "session.hpp"
#include <common/logging.hpp>
#include <algorithm>

namespace traceflow {

const char* to_string(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::ShowEmptyResults: return "show_empty_results";
        case FailurePolicy::ReturnToIdle: return "return_to_idle";
    }
    return "unknown";
}

std::optional<FailurePolicy> failure_policy_from_string(const std::string& name) {
    if (name == "show_empty_results") return FailurePolicy::ShowEmptyResults;
    if (name == "return_to_idle") return FailurePolicy::ReturnToIdle;
    return std::nullopt;
}

void CredentialStore::add(Credential credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Replace an existing credential for the same server
    auto it = std::find_if(credentials_.begin(), credentials_.end(),
        [&](const Credential& c) { return c.server_url == credential.server_url; });
    if (it != credentials_.end()) {
        *it = std::move(credential);
    } else {
        credentials_.push_back(std::move(credential));
    }
}

std::optional<Credential> CredentialStore::find(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Credential* best = nullptr;
    for (const auto& c : credentials_) {
        if (url.rfind(c.server_url, 0) == 0) {
            // Longest matching prefix wins
            if (!best || c.server_url.size() > best->server_url.size()) {
                best = &c;
            }
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return *best;
}

void CredentialStore::remove_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    credentials_.clear();
}

size_t CredentialStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credentials_.size();
}

SessionContext::SessionContext(SessionConfig config)
    : config_(std::move(config)) {
    for (const auto& credential : config_.credentials) {
        credentials_.add(credential);
    }
    if (config_.trace_types.empty()) {
        config_.trace_types = all_trace_types();
    }
    logging::get_logger()->debug("Session created with {} credential(s), tier '{}/{}'",
                                 credentials_.size(), config_.domain_network, config_.tier);
}

MapViewport SessionContext::viewport() const {
    return MapViewport(config_.viewpoint.extent, config_.viewpoint.width, config_.viewpoint.height);
}

bool SessionContext::supports(TraceType type) const {
    return std::find(config_.trace_types.begin(), config_.trace_types.end(), type) !=
           config_.trace_types.end();
}

void SessionContext::close() {
    credentials_.remove_all();
    logging::get_logger()->debug("Session closed, credentials removed");
}

}  // namespace traceflow
