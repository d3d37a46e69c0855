#include "cli_common.hpp"

namespace traceflow::cli {

int command_identify(int argc, char** argv) {
    auto log = traceflow::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || !ctx.at) {
            std::cerr << "Usage: traceflow identify <network.json> --at X,Y [-c <session.json>]\n";
            std::cerr << "Lists the features within the identify tolerance of a map point.\n";
            return 1;
        }

        SessionContext session(load_config(ctx));
        auto network = load_network(ctx.input_path, session);

        MapViewport viewport = session.viewport();
        ScreenPoint screen = viewport.to_screen(*ctx.at);
        log->debug("Map point ({}, {}) is screen ({}, {})", ctx.at->x, ctx.at->y, screen.x, screen.y);

        auto layers = network->identify(screen, session.config().identify_tolerance);
        if (layers.empty()) {
            std::cout << "No features found\n";
            return 0;
        }

        for (const auto& layer : layers) {
            std::cout << layer.layer_name << ":\n";
            for (const auto& feature : layer.features) {
                std::cout << "  object " << feature.object_id;
                auto gid = feature.attributes.find("GLOBALID");
                if (gid != feature.attributes.end()) {
                    std::cout << " " << gid->second;
                }
                auto asset = feature.attributes.find("ASSETTYPE");
                if (asset != feature.attributes.end()) {
                    std::cout << " (" << asset->second << ")";
                }
                std::cout << "\n";
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
