#include <pagescope/platform/thread_pool.h>

#include <algorithm>
#include <stdexcept>

namespace pagescope::platform {

std::string describe_exception(std::exception_ptr error) {
    if (!error) {
        return "no exception";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

ThreadPool::ThreadPool(size_t num_threads, size_t queue_capacity,
                       core::DiagnosticEmitter* diagnostics)
    : capacity_(queue_capacity > 0 ? queue_capacity : std::max<size_t>(1, num_threads) * 2),
      diagnostics_(diagnostics) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::post(std::function<void()> task) {
    {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this]() {
            return shutdown_.load() || tasks_.size() < capacity_;
        });
        if (shutdown_) {
            return false;
        }
        tasks_.emplace_back(std::move(task));
    }
    not_empty_.notify_one();
    return true;
}

std::optional<std::string> ThreadPool::submit_and_wait(std::function<void()> task) {
    auto done = std::make_shared<std::promise<std::optional<std::string>>>();
    auto signal = done->get_future();

    const bool queued = post([task = std::move(task), done]() {
        try {
            task();
            done->set_value(std::nullopt);
        } catch (...) {
            done->set_value(describe_exception(std::current_exception()));
        }
    });
    if (!queued) {
        return std::string("task dropped: pool is shutting down");
    }
    return signal.get();
}

size_t ThreadPool::size() const {
    return workers_.size();
}

size_t ThreadPool::pending() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            return; // Already shut down
        }
        shutdown_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool ThreadPool::is_running() const {
    return !shutdown_.load();
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            not_empty_.wait(lock, [this]() {
                return shutdown_.load() || !tasks_.empty();
            });

            if (tasks_.empty()) {
                // shutdown_ is true and no more tasks
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        not_full_.notify_one();

        try {
            task();
        } catch (...) {
            if (diagnostics_) {
                diagnostics_->error("platform", "worker",
                                    "task failed: " + describe_exception(std::current_exception()));
            }
        }
    }
}

} // namespace pagescope::platform
