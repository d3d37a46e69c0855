#ifndef TRACEFLOW_TRACE_TASK_HPP
#define TRACEFLOW_TRACE_TASK_HPP

#include "trace_types.hpp"
#include "cancellation.hpp"
#include <common/errors.hpp>
#include <services/trace_service.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace traceflow {

// Result slot filled by the worker thread
struct TraceCompletion {
    std::vector<TraceResult> results;
    std::optional<TraceErrorKind> error_kind;
    std::string error_message;

    bool failed() const { return error_kind.has_value(); }
    bool cancelled() const { return error_kind == TraceErrorKind::Cancelled; }
};

// One trace running on its own worker thread.
// The worker only writes the completion slot of its task; whoever owns the
// task decides whether the completion is applied. The trace service must
// outlive the task. Destruction cancels and joins.
class TraceTask {
public:
    TraceTask(uint64_t id, TraceService& service, TraceRequest request);
    ~TraceTask();

    TraceTask(const TraceTask&) = delete;
    TraceTask& operator=(const TraceTask&) = delete;

    void start();
    void cancel();

    uint64_t id() const { return id_; }
    bool finished() const;

    // Block until the worker finished or the timeout passed
    bool wait_for(std::chrono::milliseconds timeout) const;

    // Hand out the completion once; nullopt while running or after it was taken
    std::optional<TraceCompletion> take_completion();

    const TraceRequest& request() const { return request_; }

private:
    void run();

    uint64_t id_;
    TraceService& service_;
    TraceRequest request_;
    CancellationToken token_;
    std::thread worker_;

    mutable std::mutex mutex_;
    mutable std::condition_variable done_;
    bool finished_ = false;
    std::optional<TraceCompletion> completion_;
};

}  // namespace traceflow

#endif // TRACEFLOW_TRACE_TASK_HPP
