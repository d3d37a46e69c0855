#ifndef TRACEFLOW_TRACE_CANCELLATION_HPP
#define TRACEFLOW_TRACE_CANCELLATION_HPP

#include <common/errors.hpp>
#include <atomic>
#include <memory>

namespace traceflow {

// Shared cancellation flag handed to a running trace.
// Copies observe the same flag.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool is_cancelled() const { return flag_->load(); }

    // Throws TraceError(Cancelled) once cancellation was requested
    void throw_if_cancelled() const {
        if (is_cancelled()) {
            throw TraceError(TraceErrorKind::Cancelled, "Trace cancelled");
        }
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace traceflow

#endif // TRACEFLOW_TRACE_CANCELLATION_HPP
