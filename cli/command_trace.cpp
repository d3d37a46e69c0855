#include "cli_common.hpp"
#include <serialization/script_json.hpp>
#include <serialization/workflow_json.hpp>
#include <services/highlight_sink.hpp>
#include <trace/trace_workflow.hpp>
#include <trace/workflow_script.hpp>

namespace traceflow::cli {

int command_trace(int argc, char** argv) {
    auto log = traceflow::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || !ctx.script_path) {
            std::cerr << "Usage: traceflow trace <network.json> --script <script.json> "
                         "[-o <output.json>] [-c <session.json>]\n";
            return 1;
        }

        SessionContext session(load_config(ctx));
        auto network = load_network(ctx.input_path, session);
        log->info("Loaded network '{}' with {} elements", network->name(), network->records().size());

        auto steps = script_from_json(json::read_json_file(*ctx.script_path));
        log->info("Replaying {} script steps from: {}", steps.size(), *ctx.script_path);

        RecordingHighlightSink highlights(network->layer_names());
        TraceWorkflow workflow(session, WorkflowServices{*network, *network, *network, highlights});

        ScriptReport report = run_script(workflow, session.viewport(), steps);
        for (const auto& line : report.transcript) {
            log->debug("{}", line);
        }

        if (workflow.outcome()) {
            const TraceOutcome& outcome = *workflow.outcome();
            std::cout << "Trace " << to_string(workflow.trace_type()) << ": "
                      << outcome.element_count() << " element(s)";
            if (outcome.error) {
                std::cout << " (failed: " << *outcome.error << ")";
            }
            std::cout << "\n";
            for (const auto& [layer, elements] : outcome.elements_by_layer) {
                std::cout << "  " << layer << ": " << elements.size() << "\n";
            }
        } else {
            std::cout << "Workflow ended in state " << to_string(workflow.state()) << "\n";
        }

        if (!ctx.output_path.empty()) {
            json::TraceDocument document;
            document.timestamp = json::get_timestamp();
            document.network_file = ctx.input_path;
            document.script_file = *ctx.script_path;
            document.session = session.config();
            document.report = script_report_to_json(report);
            document.workflow = workflow_to_json(workflow);

            json::write_trace_document(ctx.output_path, document);
            std::cerr << "Wrote trace results to: " << ctx.output_path << "\n";
        }

        session.close();
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace traceflow::cli
