#ifndef REDLINE_HOST_FOREIGN_CALL_EXECUTOR_H
#define REDLINE_HOST_FOREIGN_CALL_EXECUTOR_H

#include "redline/core/logging.h"
#include "redline/core/types.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

namespace redline::host {

/**
 * ForeignCallExecutor: a single worker thread that runs every foreign call in
 * submission order.
 *
 * Callers block for at most the given timeout. A call that outlives its
 * timeout keeps running on the worker; its result is dropped and later calls
 * queue behind it. Anything captured by a submitted call must therefore stay
 * valid until the executor is destroyed.
 */
class ForeignCallExecutor {
public:
    ForeignCallExecutor();
    ~ForeignCallExecutor();

    ForeignCallExecutor(const ForeignCallExecutor&) = delete;
    ForeignCallExecutor& operator=(const ForeignCallExecutor&) = delete;

    template <typename R>
    QueryResult<R> call(std::function<QueryResult<R>()> fn, std::chrono::milliseconds timeout) {
        if (onWorkerThread()) {
            return invoke(fn);
        }
        auto promise = std::make_shared<std::promise<QueryResult<R>>>();
        std::future<QueryResult<R>> future = promise->get_future();
        if (!post([promise, fn = std::move(fn)]() { promise->set_value(invoke(fn)); })) {
            return QueryResult<R>::failure(QueryError::Unavailable);
        }
        if (future.wait_for(timeout) != std::future_status::ready) {
            REDLINE_LOG_WARN("foreign call timed out after %lld ms", static_cast<long long>(timeout.count()));
            return QueryResult<R>::failure(QueryError::Timeout);
        }
        return future.get();
    }

    /**
     * Variant for calls that only report a status.
     */
    QueryError callStatus(std::function<QueryError()> fn, std::chrono::milliseconds timeout);

    /**
     * Stop accepting calls, finish the queue and join the worker.
     */
    void shutdown();

    bool onWorkerThread() const;

private:
    template <typename R>
    static QueryResult<R> invoke(const std::function<QueryResult<R>()>& fn) {
        try {
            return fn();
        } catch (const std::exception& e) {
            REDLINE_LOG_WARN("foreign call threw: %s", e.what());
            return QueryResult<R>::failure(QueryError::Unavailable);
        }
    }

    bool post(std::function<void()> task);
    void run();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_{false};
    std::once_flag joined_;
    std::thread worker_;
    // Copied at start so no caller reads worker_ while another joins it.
    const std::thread::id workerId_;
};

} // namespace redline::host

#endif // REDLINE_HOST_FOREIGN_CALL_EXECUTOR_H
