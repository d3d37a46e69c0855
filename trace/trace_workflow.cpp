#include "trace_workflow.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>

namespace traceflow {

const char* to_string(WorkflowState state) {
    switch (state) {
        case WorkflowState::Idle: return "idle";
        case WorkflowState::SelectingPoints: return "selecting_points";
        case WorkflowState::SelectingTraceType: return "selecting_trace_type";
        case WorkflowState::Tracing: return "tracing";
        case WorkflowState::ViewingResults: return "viewing_results";
    }
    return "unknown";
}

const char* to_string(TapOutcome outcome) {
    switch (outcome) {
        case TapOutcome::Ignored: return "ignored";
        case TapOutcome::LookupFailure: return "lookup_failure";
        case TapOutcome::Added: return "added";
        case TapOutcome::TerminalSelectionRequired: return "terminal_selection_required";
    }
    return "unknown";
}

const char* to_string(IssueKind kind) {
    switch (kind) {
        case IssueKind::TraceSubmissionFailure: return "trace_submission_failure";
        case IssueKind::CancellationRequested: return "cancellation_requested";
    }
    return "unknown";
}

const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::StateChanged: return "state_changed";
        case EventKind::PointAdded: return "point_added";
        case EventKind::TerminalSelectionRequired: return "terminal_selection_required";
        case EventKind::TraceCompleted: return "trace_completed";
        case EventKind::TraceFailed: return "trace_failed";
        case EventKind::Reset: return "reset";
    }
    return "unknown";
}

TraceWorkflow::TraceWorkflow(const SessionContext& session, WorkflowServices services)
    : session_(session), services_(services) {}

// Members destroy in reverse order: retired_ and task_ cancel and join their workers
TraceWorkflow::~TraceWorkflow() {
    if (task_) {
        task_->cancel();
    }
    for (auto& task : retired_) {
        task->cancel();
    }
}

std::vector<Terminal> TraceWorkflow::pending_terminals() const {
    if (!pending_ || !pending_->element.asset_type.terminal_configuration) {
        return {};
    }
    return pending_->element.asset_type.terminal_configuration->terminals;
}

std::optional<std::string> TraceWorkflow::hint() const {
    switch (state_) {
        case WorkflowState::Idle:
        case WorkflowState::ViewingResults:
            return std::nullopt;
        case WorkflowState::SelectingPoints:
            return std::string("Tap on the map to add a ") +
                   (point_type_ == PointType::Start ? "Starting Location" : "Barrier") + ".";
        case WorkflowState::SelectingTraceType:
            return std::string("Choose the trace type");
        case WorkflowState::Tracing:
            return std::string("Tracing...");
    }
    return std::nullopt;
}

bool TraceWorkflow::can_advance() const {
    return state_ == WorkflowState::SelectingPoints && !pending_ && !starting_points_.empty();
}

bool TraceWorkflow::can_run_trace() const {
    return state_ == WorkflowState::SelectingTraceType && !starting_points_.empty();
}

void TraceWorkflow::start() {
    require_state(WorkflowState::Idle, "start a trace");
    set_state(WorkflowState::SelectingPoints);
}

void TraceWorkflow::set_point_type(PointType type) {
    require_state(WorkflowState::SelectingPoints, "change the point type");
    point_type_ = type;
}

TapOutcome TraceWorkflow::tap(const ScreenPoint& screen_point, const Point& map_point) {
    auto log = logging::get_logger();

    if (state_ != WorkflowState::SelectingPoints || pending_) {
        return TapOutcome::Ignored;
    }

    std::vector<IdentifyLayerResult> layers;
    try {
        layers = services_.identify.identify(screen_point, session_.config().identify_tolerance);
    } catch (const std::exception& e) {
        log->debug("Identify failed at ({}, {}): {}", screen_point.x, screen_point.y, e.what());
        return TapOutcome::LookupFailure;
    }

    if (layers.empty() || layers.front().features.empty()) {
        log->debug("Nothing identified at ({}, {})", screen_point.x, screen_point.y);
        return TapOutcome::LookupFailure;
    }
    const Feature& feature = layers.front().features.front();

    std::optional<SourceKind> kind = services_.elements.source_kind(feature.table_name);
    if (!kind) {
        log->debug("Table '{}' is not part of the network", feature.table_name);
        return TapOutcome::LookupFailure;
    }

    std::optional<NetworkElement> element = services_.elements.make_element(feature);
    if (!element) {
        log->debug("No network element for feature {} in '{}'", feature.object_id, feature.table_name);
        return TapOutcome::LookupFailure;
    }

    switch (*kind) {
        case SourceKind::Junction: {
            if (!feature.geometry) {
                log->debug("Junction {} has no geometry", element->global_id);
                return TapOutcome::LookupFailure;
            }
            if (element->asset_type.terminal_count() > 1) {
                pending_ = PendingItem{std::move(*element), feature};
                log->debug("Junction {} has {} terminals, waiting for selection",
                           pending_->element.global_id, pending_->element.asset_type.terminal_count());
                emit(EventKind::TerminalSelectionRequired);
                return TapOutcome::TerminalSelectionRequired;
            }
            commit(std::move(*element), *feature.geometry);
            return TapOutcome::Added;
        }
        case SourceKind::Edge: {
            const Polyline* line = feature.geometry ? std::get_if<Polyline>(&*feature.geometry) : nullptr;
            if (!line || line->points.size() < 2) {
                log->debug("Edge {} has no line geometry", element->global_id);
                return TapOutcome::LookupFailure;
            }
            element->fraction_along_edge = fraction_along(*line, map_point);
            commit(std::move(*element), Geometry{map_point.flattened()});
            return TapOutcome::Added;
        }
    }
    return TapOutcome::LookupFailure;
}

void TraceWorkflow::select_terminal(size_t index) {
    if (!pending_) {
        throw WorkflowError(WorkflowErrorKind::NoPendingItem, "No element is waiting for a terminal");
    }
    std::vector<Terminal> terminals = pending_terminals();
    if (index >= terminals.size()) {
        throw WorkflowError(WorkflowErrorKind::InvalidTerminal,
                            "Terminal index " + std::to_string(index) + " out of range (" +
                            std::to_string(terminals.size()) + " terminals)");
    }

    PendingItem item = std::move(*pending_);
    pending_.reset();

    item.element.terminal = terminals[index];
    commit(std::move(item.element), *item.feature.geometry);
}

void TraceWorkflow::dismiss_terminal_selection() {
    if (pending_) {
        logging::get_logger()->debug("Terminal selection dismissed for {}", pending_->element.global_id);
        pending_.reset();
    }
}

void TraceWorkflow::next() {
    require_state(WorkflowState::SelectingPoints, "choose the trace type");
    if (pending_) {
        throw WorkflowError(WorkflowErrorKind::InvalidTransition,
                            "A terminal must be selected before continuing");
    }
    if (starting_points_.empty()) {
        throw WorkflowError(WorkflowErrorKind::NoStartPoints,
                            "At least one starting location is required");
    }
    set_state(WorkflowState::SelectingTraceType);
}

void TraceWorkflow::set_trace_type(TraceType type) {
    if (state_ != WorkflowState::SelectingPoints && state_ != WorkflowState::SelectingTraceType) {
        throw WorkflowError(WorkflowErrorKind::InvalidTransition,
                            std::string("Cannot change the trace type while ") + to_string(state_));
    }
    if (!session_.supports(type)) {
        throw WorkflowError(WorkflowErrorKind::UnsupportedTraceType,
                            std::string("Trace type not supported: ") + to_string(type));
    }
    trace_type_ = type;
}

void TraceWorkflow::run_trace() {
    auto log = logging::get_logger();

    require_state(WorkflowState::SelectingTraceType, "run a trace");
    if (starting_points_.empty()) {
        throw WorkflowError(WorkflowErrorKind::NoStartPoints,
                            "At least one starting location is required");
    }

    reap_retired();

    TraceRequest request = build_request();
    log->info("Running {} trace: {} start(s), {} barrier(s)",
              to_string(request.type), request.starting_locations.size(), request.barriers.size());

    auto task = std::make_unique<TraceTask>(++next_task_id_, services_.tracer, std::move(request));
    task->start();
    task_ = std::move(task);

    outcome_.reset();
    last_error_.reset();
    set_state(WorkflowState::Tracing);
}

bool TraceWorkflow::poll() {
    reap_retired();

    if (state_ != WorkflowState::Tracing || !task_) {
        return false;
    }

    std::optional<TraceCompletion> completion = task_->take_completion();
    if (!completion) {
        return false;
    }
    task_.reset();

    apply_completion(std::move(*completion));
    return true;
}

bool TraceWorkflow::wait_for_completion(std::chrono::milliseconds timeout) {
    if (state_ != WorkflowState::Tracing || !task_) {
        return false;
    }
    if (!task_->wait_for(timeout)) {
        return false;
    }
    return poll();
}

void TraceWorkflow::reset() {
    auto log = logging::get_logger();

    if (task_) {
        log->debug("Cancelling trace task {}", task_->id());
        task_->cancel();
        retired_.push_back(std::move(task_));
    }
    reap_retired();

    clear_cycle();
    last_error_.reset();

    set_state(WorkflowState::Idle);
    emit(EventKind::Reset);
}

TraceRequest TraceWorkflow::build_request() const {
    TraceRequest request;
    request.type = trace_type_;
    for (const auto& point : starting_points_) {
        request.starting_locations.push_back(point.element);
    }
    for (const auto& point : barriers_) {
        request.barriers.push_back(point.element);
    }
    request.configuration = services_.tracer.default_trace_configuration(
        session_.config().domain_network, session_.config().tier);
    return request;
}

SubscriptionId TraceWorkflow::subscribe(WorkflowListener listener) {
    SubscriptionId id = ++next_subscription_;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void TraceWorkflow::unsubscribe(SubscriptionId id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     listeners_.end());
}

void TraceWorkflow::require_state(WorkflowState expected, const char* action) const {
    if (state_ != expected) {
        throw WorkflowError(WorkflowErrorKind::InvalidTransition,
                            std::string("Cannot ") + action + " while " + to_string(state_));
    }
}

void TraceWorkflow::set_state(WorkflowState state) {
    if (state_ == state) {
        return;
    }
    logging::get_logger()->debug("Workflow {} -> {}", to_string(state_), to_string(state));
    state_ = state;
    emit(EventKind::StateChanged);
}

void TraceWorkflow::emit(EventKind kind) {
    WorkflowEvent event{kind, state_};
    // Copy so listeners may unsubscribe while being notified
    auto listeners = listeners_;
    for (const auto& [id, listener] : listeners) {
        listener(event);
    }
}

void TraceWorkflow::commit(NetworkElement element, const Geometry& marker) {
    TracePoint point;
    point.type = point_type_;
    point.element = std::move(element);
    point.location = anchor_point(marker);

    logging::get_logger()->debug("Added {} {} ({})", to_string(point.type),
                                 point.element.global_id, point.element.source.name);

    if (point.type == PointType::Start) {
        starting_points_.push_back(std::move(point));
    } else {
        barriers_.push_back(std::move(point));
    }
    services_.highlights.add_marker(marker, point_type_);
    emit(EventKind::PointAdded);
}

void TraceWorkflow::apply_completion(TraceCompletion completion) {
    auto log = logging::get_logger();

    if (completion.failed()) {
        log->warn("Trace failed ({}): {}", to_string(*completion.error_kind), completion.error_message);
        IssueKind kind = completion.cancelled() ? IssueKind::CancellationRequested
                                                : IssueKind::TraceSubmissionFailure;
        last_error_ = WorkflowIssue{kind, completion.error_message};

        if (session_.config().failure_policy == FailurePolicy::ReturnToIdle) {
            clear_cycle();
            set_state(WorkflowState::Idle);
        } else {
            TraceOutcome empty;
            empty.error = completion.error_message;
            outcome_ = std::move(empty);
            set_state(WorkflowState::ViewingResults);
        }
        emit(EventKind::TraceFailed);
        return;
    }

    outcome_ = make_outcome(std::move(completion.results));
    log->info("Trace complete: {} element(s) in {} layer(s)",
              outcome_->element_count(), outcome_->elements_by_layer.size());

    // The outcome stands even when highlighting it fails
    try {
        for (const auto& [layer, elements] : outcome_->elements_by_layer) {
            if (!services_.highlights.select_elements(layer, elements)) {
                log->debug("Layer '{}' is not displayed; {} element(s) not highlighted",
                           layer, elements.size());
            }
        }
    } catch (const std::exception& e) {
        log->warn("Highlighting trace results failed: {}", e.what());
        last_error_ = WorkflowIssue{IssueKind::TraceSubmissionFailure, e.what()};
    }

    set_state(WorkflowState::ViewingResults);
    emit(EventKind::TraceCompleted);
}

void TraceWorkflow::clear_cycle() {
    starting_points_.clear();
    barriers_.clear();
    pending_.reset();
    outcome_.reset();
    point_type_ = PointType::Start;
    trace_type_ = TraceType::Connected;
    try {
        services_.highlights.clear();
    } catch (const std::exception& e) {
        logging::get_logger()->warn("Clearing highlights failed: {}", e.what());
    }
}

void TraceWorkflow::reap_retired() {
    retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                  [](const std::unique_ptr<TraceTask>& task) {
                                      return task->finished();
                                  }),
                   retired_.end());
}

}  // namespace traceflow
