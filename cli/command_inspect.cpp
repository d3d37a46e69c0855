#include "cli_common.hpp"
#include <map>

namespace traceflow::cli {

int command_inspect(int argc, char** argv) {
    auto log = traceflow::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: traceflow inspect <network.json> [-c <session.json>]\n";
            return 1;
        }

        SessionContext session(load_config(ctx));
        auto network = load_network(ctx.input_path, session);
        const NetworkDefinition& definition = network->definition();

        std::map<std::string, size_t> per_source;
        size_t controllers = 0;
        for (const auto& record : network->records()) {
            ++per_source[record.source];
            if (record.is_controller) {
                ++controllers;
            }
        }

        std::cout << "Network: " << network->name() << "\n";
        std::cout << "Elements: " << network->records().size()
                  << ", associations: " << network->association_count()
                  << ", controllers: " << controllers << "\n";

        std::cout << "Sources:\n";
        for (const auto& source : definition.sources) {
            std::cout << "  " << source.name << " (" << to_string(source.kind)
                      << ", layer " << source.layer_id << "): "
                      << per_source[source.name] << " element(s)\n";
        }

        std::cout << "Asset types:\n";
        for (const auto& asset : definition.asset_types) {
            std::cout << "  " << asset.name;
            if (asset.terminal_count() > 0) {
                std::cout << " [";
                const auto& terminals = asset.terminal_configuration->terminals;
                for (size_t i = 0; i < terminals.size(); ++i) {
                    std::cout << (i ? ", " : "") << terminals[i].name;
                }
                std::cout << "]";
            }
            std::cout << "\n";
        }

        std::cout << "Tiers:\n";
        for (const auto& domain : definition.domain_networks) {
            for (const auto& tier : domain.tiers) {
                bool active = domain.name == session.config().domain_network &&
                              tier.name == session.config().tier;
                std::cout << "  " << domain.name << " / " << tier.name
                          << (active ? " (session default)" : "") << "\n";
            }
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace traceflow::cli
