#ifndef TRACEFLOW_COMMON_ERRORS_HPP
#define TRACEFLOW_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace traceflow {

// Failure categories reported by the trace execution service
enum class TraceErrorKind {
    Service,         // Service rejected or failed the trace
    Transport,       // Service could not be reached
    Unauthorized,    // Missing or rejected credential
    InvalidRequest,  // Request references unknown elements
    Cancelled        // Caller requested cancellation
};

const char* to_string(TraceErrorKind kind);

// Thrown by collaborators (trace service, network loading)
class TraceError : public std::runtime_error {
public:
    TraceError(TraceErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    TraceErrorKind kind() const { return kind_; }

private:
    TraceErrorKind kind_;
};

enum class WorkflowErrorKind {
    InvalidTransition,
    NoStartPoints,
    NoPendingItem,
    InvalidTerminal,
    UnsupportedTraceType
};

const char* to_string(WorkflowErrorKind kind);

// Thrown when a workflow operation is called in a state that does not allow it
class WorkflowError : public std::logic_error {
public:
    WorkflowError(WorkflowErrorKind kind, const std::string& message)
        : std::logic_error(message), kind_(kind) {}

    WorkflowErrorKind kind() const { return kind_; }

private:
    WorkflowErrorKind kind_;
};

}  // namespace traceflow

#endif // TRACEFLOW_COMMON_ERRORS_HPP
