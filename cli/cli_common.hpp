#ifndef TRACEFLOW_CLI_COMMON_HPP
#define TRACEFLOW_CLI_COMMON_HPP

#include <common/logging.hpp>
#include <common/session.hpp>
#include <network/memory_network.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/network_json.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace traceflow::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<std::string> script_path;
    std::optional<Point> at;
    bool verbose = false;
};

// Parse "X,Y" into a map point
inline Point parse_point(const std::string& text) {
    std::istringstream iss(text);
    Point p;
    char comma = 0;
    if (!(iss >> p.x >> comma >> p.y) || comma != ',') {
        throw std::runtime_error("Expected a point as X,Y but got: " + text);
    }
    return p;
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto require_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        i += 2;
        return argv[i - 1];
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = require_value("-o/--output");
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = require_value("-c/--config");
        } else if (arg == "-s" || arg == "--script") {
            ctx.script_path = require_value("-s/--script");
        } else if (arg == "--at") {
            ctx.at = parse_point(require_value("--at"));
        } else if (arg == "-h" || arg == "--help") {
            // Handled by caller
            ++i;
        } else if (arg[0] != '-') {
            // Positional argument (network file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.verbose) {
        logging::get_logger()->set_level(spdlog::level::debug);
    }

    return {ctx, i};
}

// Session configuration from -c, or defaults
inline SessionConfig load_config(const CommandContext& ctx) {
    if (!ctx.config_path) {
        return SessionConfig{};
    }
    SessionConfig config = load_session_config(*ctx.config_path);
    logging::get_logger()->info("Loaded session configuration from: {}", *ctx.config_path);
    return config;
}

// Read and load a network file against a session
inline std::unique_ptr<InMemoryNetwork> load_network(const std::string& path,
                                                     const SessionContext& session) {
    NetworkData data = network_from_json(json::read_json_file(path));
    if (data.name.empty()) {
        data.name = path;
    }
    auto network = std::make_unique<InMemoryNetwork>(std::move(data), session);
    network->load();
    return network;
}

// Command function declarations
int command_inspect(int argc, char** argv);
int command_identify(int argc, char** argv);
int command_trace(int argc, char** argv);

}  // namespace traceflow::cli

#endif // TRACEFLOW_CLI_COMMON_HPP
