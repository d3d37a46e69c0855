#ifndef TRACEFLOW_TRACE_WORKFLOW_SCRIPT_HPP
#define TRACEFLOW_TRACE_WORKFLOW_SCRIPT_HPP

#include "trace_workflow.hpp"
#include <geometry/viewport.hpp>
#include <chrono>
#include <string>
#include <variant>
#include <vector>

namespace traceflow {

// Scripted user actions, replayed against a workflow
namespace step {

struct Start {};
struct SetPointType { PointType type; };
struct Tap { Point location; };           // Map coordinates
struct SelectTerminal { size_t index; };
struct DismissTerminal {};
struct Next {};
struct SetTraceType { TraceType type; };
struct Run {};
struct Wait { std::chrono::milliseconds timeout{5000}; };
struct Reset {};

}  // namespace step

using ScriptStep = std::variant<
    step::Start, step::SetPointType, step::Tap,
    step::SelectTerminal, step::DismissTerminal,
    step::Next, step::SetTraceType, step::Run,
    step::Wait, step::Reset
>;

const char* step_name(const ScriptStep& s);

struct ScriptReport {
    size_t steps_run = 0;
    size_t taps = 0;
    size_t points_added = 0;
    size_t lookup_failures = 0;
    size_t ignored_taps = 0;
    size_t terminal_prompts = 0;
    std::vector<std::string> transcript;
};

// Replay steps in order. Taps are converted to screen points through the
// viewport. Throws std::runtime_error naming the failing step when the
// workflow rejects an action or a wait times out.
ScriptReport run_script(TraceWorkflow& workflow,
                        const MapViewport& viewport,
                        const std::vector<ScriptStep>& steps);

}  // namespace traceflow

#endif // TRACEFLOW_TRACE_WORKFLOW_SCRIPT_HPP
