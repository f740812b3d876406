#pragma once
#include <pagescope/core/config.h>
#include <pagescope/core/diagnostics.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pagescope::platform {

// Message for a captured exception ("unknown exception" for non-std types).
std::string describe_exception(std::exception_ptr error);

// Fixed-size worker pool over one bounded FIFO queue. Submitting to a full
// queue blocks the caller until a worker frees a slot; once shutdown() has
// begun, submissions are dropped instead.
class ThreadPool {
public:
    // queue_capacity == 0 selects two slots per worker.
    explicit ThreadPool(size_t num_threads = core::config::kDefaultWorkerCount,
                        size_t queue_capacity = 0,
                        core::DiagnosticEmitter* diagnostics = nullptr);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Submit a task and get a future for the result. A dropped task leaves
    // the future with std::future_errc::broken_promise.
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    // Enqueue a fire-and-forget task. Returns false if it was dropped because
    // the pool is shutting down. Exceptions escaping the task are logged.
    bool post(std::function<void()> task);

    // Run task on a worker and block until it has finished. Returns the
    // task's failure message, or nullopt on success.
    std::optional<std::string> submit_and_wait(std::function<void()> task);

    size_t size() const;
    size_t queue_capacity() const { return capacity_; }
    size_t pending() const;

    // Stop accepting work, let queued tasks drain, join the workers.
    // Safe to call more than once.
    void shutdown();

    bool is_running() const;

private:
    void worker_loop();

    std::vector<std::jthread> workers_;
    std::deque<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::atomic<bool> shutdown_{false};
    size_t capacity_;
    core::DiagnosticEmitter* diagnostics_;
};

// Template implementation
template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using ReturnType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    auto future = task->get_future();
    if (!post([task]() { (*task)(); }) && diagnostics_) {
        diagnostics_->warning("platform", "submit", "task dropped: pool is shutting down");
    }
    return future;
}

} // namespace pagescope::platform
