#pragma once
#include <pagescope/core/error.h>
#include <pagescope/platform/thread_pool.h>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pagescope::platform {

// Outcome of one named task. Both fields empty means "no such task" (or the
// group has not executed yet).
template<typename T>
struct TaskResult {
    std::optional<T> value;
    std::optional<std::string> error;

    bool ok() const { return value.has_value() && !error.has_value(); }
};

// Per-request batch of named tasks run on a shared pool. execute_all() waits
// for every task, successful or not; one failure never hides another task's
// result. A task fails by throwing or by returning a core::AnalysisError.
template<typename T>
class TaskGroup {
public:
    using Task = std::function<core::Result<T>()>;

    explicit TaskGroup(ThreadPool& pool) : pool_(pool) {}

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    // Returns false for a duplicate name or once the group has executed.
    bool add(std::string name, Task task);

    // Blocks until every task has run. Runs at most once per group.
    void execute_all();

    TaskResult<T> get_result(const std::string& name) const;

    bool has_errors() const;
    std::map<std::string, std::string> errors() const;

    // Task names in insertion order.
    std::vector<std::string> names() const;
    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        std::string name;
        Task task;
        TaskResult<T> result;
    };

    // Private completion signal shared with in-flight tasks, so the last
    // notifier never touches state owned by a returned execute_all() frame.
    struct Completion {
        std::mutex mutex;
        std::condition_variable cv;
        size_t remaining = 0;
    };

    const Entry* find(const std::string& name) const;

    ThreadPool& pool_;
    std::vector<Entry> entries_;
    bool executed_ = false;
};

// Template implementation
template<typename T>
bool TaskGroup<T>::add(std::string name, Task task) {
    if (executed_ || find(name) != nullptr) {
        return false;
    }
    entries_.push_back(Entry{std::move(name), std::move(task), {}});
    return true;
}

template<typename T>
void TaskGroup<T>::execute_all() {
    if (executed_) {
        return;
    }
    executed_ = true;

    auto completion = std::make_shared<Completion>();
    completion->remaining = entries_.size();

    auto finish = [completion]() {
        std::lock_guard lock(completion->mutex);
        if (--completion->remaining == 0) {
            completion->cv.notify_all();
        }
    };

    for (auto& entry : entries_) {
        Entry* slot = &entry;
        const bool queued = pool_.post([slot, finish]() {
            try {
                core::Result<T> outcome = slot->task();
                if (outcome.ok()) {
                    slot->result.value = std::move(outcome).value();
                } else {
                    slot->result.error = outcome.error().error_message;
                }
            } catch (...) {
                slot->result.error = describe_exception(std::current_exception());
            }
            finish();
        });
        if (!queued) {
            slot->result.error = "task dropped: pool is shutting down";
            finish();
        }
    }

    std::unique_lock lock(completion->mutex);
    completion->cv.wait(lock, [&completion]() { return completion->remaining == 0; });
}

template<typename T>
TaskResult<T> TaskGroup<T>::get_result(const std::string& name) const {
    const Entry* entry = find(name);
    if (!entry) {
        return {};
    }
    return entry->result;
}

template<typename T>
bool TaskGroup<T>::has_errors() const {
    for (const auto& entry : entries_) {
        if (entry.result.error.has_value()) {
            return true;
        }
    }
    return false;
}

template<typename T>
std::map<std::string, std::string> TaskGroup<T>::errors() const {
    std::map<std::string, std::string> result;
    for (const auto& entry : entries_) {
        if (entry.result.error.has_value()) {
            result.emplace(entry.name, *entry.result.error);
        }
    }
    return result;
}

template<typename T>
std::vector<std::string> TaskGroup<T>::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.name);
    }
    return result;
}

template<typename T>
const typename TaskGroup<T>::Entry* TaskGroup<T>::find(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace pagescope::platform
