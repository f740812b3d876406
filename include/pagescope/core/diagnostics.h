#pragma once

#include <pagescope/core/config.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace pagescope::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::system_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Observer that writes one formatted line per event. The stream must outlive
// the emitter the observer is registered with.
DiagnosticObserver stream_observer(std::ostream& stream);

// Thread-safe event sink shared by the service, its worker pool and the
// fetcher. Observers run on the emitting thread, outside the lock.
// max_retained == 0 keeps no history; observers still see every event.
class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::size_t max_retained = config::kMaxRetainedDiagnostics);

    DiagnosticEmitter(const DiagnosticEmitter&) = delete;
    DiagnosticEmitter& operator=(const DiagnosticEmitter&) = delete;

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message,
              std::uint64_t correlation_id = 0);

    void info(const std::string& module, const std::string& stage,
              const std::string& message, std::uint64_t correlation_id = 0);
    void warning(const std::string& module, const std::string& stage,
                 const std::string& message, std::uint64_t correlation_id = 0);
    void error(const std::string& module, const std::string& stage,
               const std::string& message, std::uint64_t correlation_id = 0);

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::vector<DiagnosticEvent> events_by_correlation(std::uint64_t correlation_id) const;

    // Allocates a fresh, non-zero correlation id.
    std::uint64_t next_correlation_id();

    void clear();
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::size_t max_retained_;
    std::uint64_t last_correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

} // namespace pagescope::core
