#include "cli_common.hpp"
#include <string>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Runs utility network traces against a network file.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  inspect <network.json>                    Summarize sources, asset types and tiers\n";
    std::cerr << "  identify <network.json> --at X,Y          List features near a map point\n";
    std::cerr << "  trace <network.json> --script <file>      Replay a workflow script and trace\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -c, --config <file>   Session configuration (JSON)\n";
    std::cerr << "  -o, --output <file>   Write results as JSON\n";
    std::cerr << "  -s, --script <file>   Workflow script (JSON)\n";
    std::cerr << "  --at X,Y              Map coordinates\n";
    std::cerr << "  -v, --verbose         Debug logging\n";
    std::cerr << "  -h, --help            Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  TRACEFLOW_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    if (command == "inspect") {
        return traceflow::cli::command_inspect(argc, argv);
    }
    if (command == "identify") {
        return traceflow::cli::command_identify(argc, argv);
    }
    if (command == "trace") {
        return traceflow::cli::command_trace(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
