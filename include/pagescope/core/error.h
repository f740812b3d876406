#pragma once

#include <string>
#include <utility>
#include <variant>

namespace pagescope::core {

// The single typed failure the engine reports to its callers. status_code is
// an HTTP-like code (upstream status, or a code derived from the transport
// failure); the outer API layer alone picks the transport status.
struct AnalysisError {
    int status_code = 0;
    std::string error_message;
    std::string url;

    // "HTTP {code}: {message} (URL: {url})"
    std::string describe() const;
};

// Value-or-error return type for engine operations.
template<typename T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}
    Result(AnalysisError error) : state_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return std::get<T>(state_); }
    T& value() & { return std::get<T>(state_); }
    T&& value() && { return std::get<T>(std::move(state_)); }

    const AnalysisError& error() const { return std::get<AnalysisError>(state_); }

private:
    std::variant<T, AnalysisError> state_;
};

} // namespace pagescope::core
