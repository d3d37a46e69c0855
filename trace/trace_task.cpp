#include "trace_task.hpp"
#include <common/logging.hpp>
#include <stdexcept>

namespace traceflow {

TraceTask::TraceTask(uint64_t id, TraceService& service, TraceRequest request)
    : id_(id), service_(service), request_(std::move(request)) {}

TraceTask::~TraceTask() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TraceTask::start() {
    if (worker_.joinable()) {
        throw std::logic_error("Trace task already started");
    }
    worker_ = std::thread([this]() { run(); });
}

void TraceTask::cancel() {
    token_.cancel();
}

bool TraceTask::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

bool TraceTask::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return done_.wait_for(lock, timeout, [this]() { return finished_; });
}

std::optional<TraceCompletion> TraceTask::take_completion() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!finished_ || !completion_) {
        return std::nullopt;
    }
    std::optional<TraceCompletion> completion = std::move(completion_);
    completion_.reset();
    return completion;
}

void TraceTask::run() {
    auto log = logging::get_logger();
    TraceCompletion completion;

    try {
        completion.results = service_.trace(request_, token_);
        if (token_.is_cancelled()) {
            completion.results.clear();
            completion.error_kind = TraceErrorKind::Cancelled;
            completion.error_message = "Trace cancelled";
        }
    } catch (const TraceError& e) {
        completion.error_kind = e.kind();
        completion.error_message = e.what();
    } catch (const std::exception& e) {
        completion.error_kind = TraceErrorKind::Service;
        completion.error_message = e.what();
    }

    if (completion.failed()) {
        log->debug("Trace task {} ended: {} ({})", id_,
                   to_string(*completion.error_kind), completion.error_message);
    } else {
        log->debug("Trace task {} finished with {} result(s)", id_, completion.results.size());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        completion_ = std::move(completion);
        finished_ = true;
    }
    done_.notify_all();
}

}  // namespace traceflow
