#ifndef TRACEFLOW_SERIALIZATION_WORKFLOW_JSON_HPP
#define TRACEFLOW_SERIALIZATION_WORKFLOW_JSON_HPP

#include <nlohmann/json.hpp>
#include <trace/trace_workflow.hpp>
#include <trace/workflow_script.hpp>
#include "trace_json.hpp"

namespace traceflow {

// Snapshot of a workflow: state, collected points and outcome
inline nlohmann::json workflow_to_json(const TraceWorkflow& workflow) {
    nlohmann::json j;
    j["state"] = to_string(workflow.state());
    j["point_type"] = workflow.point_type();
    j["trace_type"] = workflow.trace_type();
    j["starting_points"] = workflow.starting_points();
    j["barriers"] = workflow.barriers();
    if (workflow.pending_item()) {
        j["pending"] = workflow.pending_item()->element;
    }
    if (workflow.outcome()) {
        j["outcome"] = trace_outcome_to_json(*workflow.outcome());
    }
    if (workflow.last_error()) {
        j["error"] = {
            {"kind", to_string(workflow.last_error()->kind)},
            {"message", workflow.last_error()->message}
        };
    }
    return j;
}

inline nlohmann::json script_report_to_json(const ScriptReport& report) {
    return {
        {"steps_run", report.steps_run},
        {"taps", report.taps},
        {"points_added", report.points_added},
        {"lookup_failures", report.lookup_failures},
        {"ignored_taps", report.ignored_taps},
        {"terminal_prompts", report.terminal_prompts}
    };
}

}  // namespace traceflow

#endif // TRACEFLOW_SERIALIZATION_WORKFLOW_JSON_HPP
