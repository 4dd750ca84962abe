#include "redline/host/foreign_call_executor.h"

namespace redline::host {

ForeignCallExecutor::ForeignCallExecutor()
    : worker_([this]() { run(); })
    , workerId_(worker_.get_id()) {
}

ForeignCallExecutor::~ForeignCallExecutor() {
    shutdown();
}

void ForeignCallExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    // The worker cannot join itself; a later call from another thread will.
    if (onWorkerThread()) return;
    // Concurrent callers wait here until the one joining is done.
    std::call_once(joined_, [this]() { worker_.join(); });
}

bool ForeignCallExecutor::onWorkerThread() const {
    return std::this_thread::get_id() == workerId_;
}

QueryError ForeignCallExecutor::callStatus(std::function<QueryError()> fn, std::chrono::milliseconds timeout) {
    const QueryResult<bool> result = call<bool>(
        [fn = std::move(fn)]() {
            const QueryError err = fn();
            return err == QueryError::Ok ? QueryResult<bool>::success(true) : QueryResult<bool>::failure(err);
        },
        timeout);
    return result.error;
}

bool ForeignCallExecutor::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void ForeignCallExecutor::run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}

} // namespace redline::host
