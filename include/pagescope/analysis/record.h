#pragma once
#include <pagescope/core/error.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace pagescope::core {

// {"status_code":N,"error_message":"...","url":"..."}
void to_json(nlohmann::ordered_json& json, const AnalysisError& error);

} // namespace pagescope::core

namespace pagescope::analysis {

// Heading level ("h1".."h6") -> count. Levels that never occur are absent.
using HeadingHistogram = std::map<std::string, int>;

struct AnalysisRecord {
    std::string url;
    std::string html_version;
    std::string page_title;
    HeadingHistogram headings;
    int internal_links = 0;
    int external_links = 0;
    int inaccessible_links = 0;
    bool has_login_form = false;
    std::chrono::system_clock::time_point analyzed_at{};
    std::chrono::nanoseconds processing_time{0};

    // Extraction passes that failed; their fields hold zero values.
    std::vector<std::string> failed_passes;
};

bool operator==(const AnalysisRecord& a, const AnalysisRecord& b);

// Serializers found by nlohmann::ordered_json through ADL. Keys keep the
// insertion order below; failed_passes is emitted only when non-empty.
void to_json(nlohmann::ordered_json& json, const AnalysisRecord& record);

// Compact dump. Invalid UTF-8 in page text is replaced with U+FFFD instead
// of throwing.
std::string dump_json(const nlohmann::ordered_json& json);

std::string to_json(const AnalysisRecord& record);
std::string to_json(const core::AnalysisError& error);

// RFC 3339 UTC timestamp with millisecond precision, e.g.
// "2024-05-01T12:30:00.250Z".
std::string format_timestamp(std::chrono::system_clock::time_point time);

// Compact human-readable duration: "0s", "850µs", "150ms", "1.5s", "2m3s".
std::string format_duration(std::chrono::nanoseconds duration);

} // namespace pagescope::analysis
