#ifndef TRACEFLOW_SERIALIZATION_JSON_SERIALIZATION_HPP
#define TRACEFLOW_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace traceflow::json {

// Version of the trace document format
constexpr const char* DOCUMENT_VERSION = "1.0";

// Trace results document written by `traceflow trace -o`
struct TraceDocument {
    std::string version = DOCUMENT_VERSION;
    std::string timestamp;
    std::string network_file;
    std::string script_file;
    nlohmann::json session;   // Session configuration, without passwords
    nlohmann::json report;    // Script replay report
    nlohmann::json workflow;  // Final workflow snapshot

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["version"] = version;
        if (!timestamp.empty()) j["timestamp"] = timestamp;
        j["network_file"] = network_file;
        if (!script_file.empty()) j["script_file"] = script_file;
        j["session"] = session;
        j["report"] = report;
        j["workflow"] = workflow;
        return j;
    }
};

// Current time in ISO 8601 format
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

inline void write_trace_document(const std::string& path, const TraceDocument& document) {
    write_json_file(path, document.to_json());
}

}  // namespace traceflow::json

#endif // TRACEFLOW_SERIALIZATION_JSON_SERIALIZATION_HPP
