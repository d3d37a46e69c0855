#include "workflow_script.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace traceflow {

const char* step_name(const ScriptStep& s) {
    return std::visit([](const auto& value) -> const char* {
        using T = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<T, step::Start>) return "start";
        else if constexpr (std::is_same_v<T, step::SetPointType>) return "point_type";
        else if constexpr (std::is_same_v<T, step::Tap>) return "tap";
        else if constexpr (std::is_same_v<T, step::SelectTerminal>) return "select_terminal";
        else if constexpr (std::is_same_v<T, step::DismissTerminal>) return "dismiss";
        else if constexpr (std::is_same_v<T, step::Next>) return "next";
        else if constexpr (std::is_same_v<T, step::SetTraceType>) return "trace_type";
        else if constexpr (std::is_same_v<T, step::Run>) return "run";
        else if constexpr (std::is_same_v<T, step::Wait>) return "wait";
        else if constexpr (std::is_same_v<T, step::Reset>) return "reset";
    }, s);
}

namespace {

std::string describe(const ScriptStep& s, const TraceWorkflow& workflow) {
    std::ostringstream oss;
    oss << step_name(s) << " -> " << to_string(workflow.state());
    return oss.str();
}

}  // namespace

ScriptReport run_script(TraceWorkflow& workflow,
                        const MapViewport& viewport,
                        const std::vector<ScriptStep>& steps) {
    auto log = logging::get_logger();
    ScriptReport report;

    for (size_t i = 0; i < steps.size(); ++i) {
        const ScriptStep& current = steps[i];
        std::string note;

        try {
            std::visit([&](const auto& value) {
                using T = std::decay_t<decltype(value)>;

                if constexpr (std::is_same_v<T, step::Start>) {
                    workflow.start();
                }
                else if constexpr (std::is_same_v<T, step::SetPointType>) {
                    workflow.set_point_type(value.type);
                }
                else if constexpr (std::is_same_v<T, step::Tap>) {
                    ++report.taps;
                    TapOutcome outcome = workflow.tap(viewport.to_screen(value.location), value.location);
                    switch (outcome) {
                        case TapOutcome::Added: ++report.points_added; break;
                        case TapOutcome::LookupFailure: ++report.lookup_failures; break;
                        case TapOutcome::Ignored: ++report.ignored_taps; break;
                        case TapOutcome::TerminalSelectionRequired: ++report.terminal_prompts; break;
                    }
                    note = to_string(outcome);
                }
                else if constexpr (std::is_same_v<T, step::SelectTerminal>) {
                    workflow.select_terminal(value.index);
                    ++report.points_added;
                }
                else if constexpr (std::is_same_v<T, step::DismissTerminal>) {
                    workflow.dismiss_terminal_selection();
                }
                else if constexpr (std::is_same_v<T, step::Next>) {
                    workflow.next();
                }
                else if constexpr (std::is_same_v<T, step::SetTraceType>) {
                    workflow.set_trace_type(value.type);
                }
                else if constexpr (std::is_same_v<T, step::Run>) {
                    workflow.run_trace();
                }
                else if constexpr (std::is_same_v<T, step::Wait>) {
                    if (workflow.state() == WorkflowState::Tracing &&
                        !workflow.wait_for_completion(value.timeout)) {
                        throw std::runtime_error("trace did not finish within " +
                                                 std::to_string(value.timeout.count()) + " ms");
                    }
                }
                else if constexpr (std::is_same_v<T, step::Reset>) {
                    workflow.reset();
                }
            }, current);
        } catch (const WorkflowError& e) {
            throw std::runtime_error("Step " + std::to_string(i + 1) + " (" + step_name(current) +
                                     "): " + e.what());
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("Step " + std::to_string(i + 1) + " (" + step_name(current) +
                                     "): " + e.what());
        }

        std::string line = describe(current, workflow);
        if (!note.empty()) {
            line += " [" + note + "]";
        }
        log->debug("Script step {}: {}", i + 1, line);
        report.transcript.push_back(line);
        ++report.steps_run;
    }

    return report;
}

}  // namespace traceflow
