#ifndef TRACEFLOW_COMMON_LOGGING_HPP
#define TRACEFLOW_COMMON_LOGGING_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace traceflow {
namespace logging {

// Map a level name to an spdlog level; unknown names fall back to info
inline spdlog::level::level_enum level_from_string(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::get("traceflow");
        if (!log) {
            log = spdlog::stderr_color_mt("traceflow");
        }
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        // Set log level from environment variable
        const char* level_env = std::getenv("TRACEFLOW_LOG_LEVEL");
        if (level_env) {
            log->set_level(level_from_string(level_env));
        } else {
            log->set_level(spdlog::level::info);
        }

        return log;
    }();
    return logger;
}

}  // namespace logging
}  // namespace traceflow

#endif // TRACEFLOW_COMMON_LOGGING_HPP
