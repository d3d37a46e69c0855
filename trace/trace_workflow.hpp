#ifndef TRACEFLOW_TRACE_WORKFLOW_HPP
#define TRACEFLOW_TRACE_WORKFLOW_HPP

#include "trace_types.hpp"
#include "trace_task.hpp"
#include <common/session.hpp>
#include <services/element_factory.hpp>
#include <services/highlight_sink.hpp>
#include <services/identify_service.hpp>
#include <services/trace_service.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace traceflow {

enum class WorkflowState {
    Idle,
    SelectingPoints,
    SelectingTraceType,
    Tracing,
    ViewingResults
};

const char* to_string(WorkflowState state);

// How a map tap was handled
enum class TapOutcome {
    Ignored,                    // Not collecting points, or a terminal choice is pending
    LookupFailure,              // Nothing usable under the tap
    Added,                      // A start point or barrier was committed
    TerminalSelectionRequired   // Junction with several terminals, waiting for a choice
};

const char* to_string(TapOutcome outcome);

// Trace failures surfaced through last_error(); lookup failures and
// terminal selection are reported by tap() instead
enum class IssueKind {
    TraceSubmissionFailure,
    CancellationRequested   // Service aborted the trace on its own
};

const char* to_string(IssueKind kind);

struct WorkflowIssue {
    IssueKind kind;
    std::string message;
};

enum class EventKind {
    StateChanged,
    PointAdded,
    TerminalSelectionRequired,
    TraceCompleted,
    TraceFailed,
    Reset
};

const char* to_string(EventKind kind);

struct WorkflowEvent {
    EventKind kind;
    WorkflowState state;
};

using WorkflowListener = std::function<void(const WorkflowEvent&)>;
using SubscriptionId = uint64_t;

// Element waiting for the user to pick one of its terminals
struct PendingItem {
    NetworkElement element;
    Feature feature;
};

// Collaborators the workflow talks to; all must outlive the workflow
struct WorkflowServices {
    IdentifyService& identify;
    ElementFactory& elements;
    TraceService& tracer;
    HighlightSink& highlights;
};

// Client-side state machine of a utility network trace:
//
//   Idle -> SelectingPoints -> SelectingTraceType -> Tracing -> ViewingResults
//
// with reset() returning to Idle from anywhere. All operations must be
// called from one owner thread. The trace itself runs on a worker thread;
// its completion is applied by poll() or wait_for_completion() on the owner
// thread, so state only ever changes through the methods below.
class TraceWorkflow {
public:
    TraceWorkflow(const SessionContext& session, WorkflowServices services);
    ~TraceWorkflow();

    TraceWorkflow(const TraceWorkflow&) = delete;
    TraceWorkflow& operator=(const TraceWorkflow&) = delete;

    // State
    WorkflowState state() const { return state_; }
    PointType point_type() const { return point_type_; }
    TraceType trace_type() const { return trace_type_; }
    const std::vector<TracePoint>& starting_points() const { return starting_points_; }
    const std::vector<TracePoint>& barriers() const { return barriers_; }
    const std::optional<PendingItem>& pending_item() const { return pending_; }
    const std::optional<TraceOutcome>& outcome() const { return outcome_; }
    const std::optional<WorkflowIssue>& last_error() const { return last_error_; }

    // Terminals offered for the pending item (empty without one)
    std::vector<Terminal> pending_terminals() const;

    // Instruction shown to the user for the current state
    std::optional<std::string> hint() const;

    // Action availability
    bool can_start() const { return state_ == WorkflowState::Idle; }
    bool can_advance() const;
    bool can_run_trace() const;
    bool can_cancel() const { return state_ != WorkflowState::Idle; }

    // Idle -> SelectingPoints
    void start();

    // Classification of the points committed by following taps
    void set_point_type(PointType type);

    // Resolve a map tap into a start point or barrier
    TapOutcome tap(const ScreenPoint& screen_point, const Point& map_point);

    // Commit the pending item on one of its terminals (index into pending_terminals())
    void select_terminal(size_t index);

    // Drop the pending item without committing it
    void dismiss_terminal_selection();

    // SelectingPoints -> SelectingTraceType
    void next();

    void set_trace_type(TraceType type);

    // SelectingTraceType -> Tracing
    void run_trace();

    // Apply a finished trace. Returns true when the state changed.
    bool poll();

    // Wait for the running trace and apply it. Returns false on timeout.
    bool wait_for_completion(std::chrono::milliseconds timeout);

    // Any state -> Idle; cancels a running trace and clears everything collected
    void reset();

    // Request built from the collected points and the selected trace type
    TraceRequest build_request() const;

    SubscriptionId subscribe(WorkflowListener listener);
    void unsubscribe(SubscriptionId id);

private:
    void require_state(WorkflowState expected, const char* action) const;
    void set_state(WorkflowState state);
    void emit(EventKind kind);

    void commit(NetworkElement element, const Geometry& marker);
    void apply_completion(TraceCompletion completion);
    void clear_cycle();
    void reap_retired();

    const SessionContext& session_;
    WorkflowServices services_;

    WorkflowState state_ = WorkflowState::Idle;
    PointType point_type_ = PointType::Start;
    TraceType trace_type_ = TraceType::Connected;
    std::vector<TracePoint> starting_points_;
    std::vector<TracePoint> barriers_;
    std::optional<PendingItem> pending_;
    std::optional<TraceOutcome> outcome_;
    std::optional<WorkflowIssue> last_error_;

    std::unique_ptr<TraceTask> task_;
    // Cancelled tasks whose workers may still be running; their
    // completions are dropped when they are reaped
    std::vector<std::unique_ptr<TraceTask>> retired_;
    uint64_t next_task_id_ = 0;

    std::vector<std::pair<SubscriptionId, WorkflowListener>> listeners_;
    SubscriptionId next_subscription_ = 0;
};

}  // namespace traceflow

#endif // TRACEFLOW_TRACE_WORKFLOW_HPP
