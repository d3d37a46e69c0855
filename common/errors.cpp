#include "errors.hpp"

namespace traceflow {

const char* to_string(TraceErrorKind kind) {
    switch (kind) {
        case TraceErrorKind::Service: return "service";
        case TraceErrorKind::Transport: return "transport";
        case TraceErrorKind::Unauthorized: return "unauthorized";
        case TraceErrorKind::InvalidRequest: return "invalid_request";
        case TraceErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(WorkflowErrorKind kind) {
    switch (kind) {
        case WorkflowErrorKind::InvalidTransition: return "invalid_transition";
        case WorkflowErrorKind::NoStartPoints: return "no_start_points";
        case WorkflowErrorKind::NoPendingItem: return "no_pending_item";
        case WorkflowErrorKind::InvalidTerminal: return "invalid_terminal";
        case WorkflowErrorKind::UnsupportedTraceType: return "unsupported_trace_type";
    }
    return "unknown";
}

}  // namespace traceflow
