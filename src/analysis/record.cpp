#include <pagescope/analysis/record.h>

#include <cstdint>
#include <cstdio>
#include <ctime>

namespace pagescope::core {

void to_json(nlohmann::ordered_json& json, const AnalysisError& error) {
    json = nlohmann::ordered_json{
        {"status_code", error.status_code},
        {"error_message", error.error_message},
        {"url", error.url},
    };
}

} // namespace pagescope::core

namespace pagescope::analysis {

namespace {

// Integer part of value / 10^precision, then the fractional digits with
// trailing zeros removed.
std::string format_fraction(std::uint64_t value, int precision) {
    std::uint64_t scale = 1;
    for (int i = 0; i < precision; ++i) scale *= 10;

    std::string result = std::to_string(value / scale);
    std::uint64_t fraction = value % scale;
    if (fraction == 0) {
        return result;
    }

    std::string digits(static_cast<size_t>(precision), '0');
    for (int i = precision - 1; i >= 0; --i) {
        digits[static_cast<size_t>(i)] = static_cast<char>('0' + fraction % 10);
        fraction /= 10;
    }
    while (!digits.empty() && digits.back() == '0') {
        digits.pop_back();
    }
    return result + "." + digits;
}

} // namespace

bool operator==(const AnalysisRecord& a, const AnalysisRecord& b) {
    return a.url == b.url && a.html_version == b.html_version &&
           a.page_title == b.page_title && a.headings == b.headings &&
           a.internal_links == b.internal_links && a.external_links == b.external_links &&
           a.inaccessible_links == b.inaccessible_links &&
           a.has_login_form == b.has_login_form && a.analyzed_at == b.analyzed_at &&
           a.processing_time == b.processing_time && a.failed_passes == b.failed_passes;
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    using namespace std::chrono;
    const auto millis = duration_cast<milliseconds>(time.time_since_epoch()).count();
    auto seconds = static_cast<std::time_t>(millis / 1000);
    auto remainder = static_cast<int>(millis % 1000);
    if (remainder < 0) {
        remainder += 1000;
        --seconds;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, remainder);
    return buf;
}

std::string format_duration(std::chrono::nanoseconds duration) {
    std::int64_t count = duration.count();
    if (count == 0) {
        return "0s";
    }
    const bool negative = count < 0;
    const std::uint64_t ns = negative
        ? static_cast<std::uint64_t>(-(count + 1)) + 1
        : static_cast<std::uint64_t>(count);

    std::string result;
    if (ns < 1000ULL) {
        result = std::to_string(ns) + "ns";
    } else if (ns < 1000000ULL) {
        result = format_fraction(ns, 3) + "\xC2\xB5s";  // µs
    } else if (ns < 1000000000ULL) {
        result = format_fraction(ns, 6) + "ms";
    } else {
        const std::uint64_t total_seconds = ns / 1000000000ULL;
        const std::uint64_t sub_second = ns % 1000000000ULL;
        const std::uint64_t seconds = total_seconds % 60;
        const std::uint64_t total_minutes = total_seconds / 60;

        result = format_fraction(seconds * 1000000000ULL + sub_second, 9) + "s";
        if (total_minutes > 0) {
            result = std::to_string(total_minutes % 60) + "m" + result;
            if (total_minutes >= 60) {
                result = std::to_string(total_minutes / 60) + "h" + result;
            }
        }
    }
    return negative ? "-" + result : result;
}

void to_json(nlohmann::ordered_json& json, const AnalysisRecord& record) {
    json = nlohmann::ordered_json{
        {"url", record.url},
        {"html_version", record.html_version},
        {"page_title", record.page_title},
        {"headings", nlohmann::ordered_json::object()},
        {"internal_links", record.internal_links},
        {"external_links", record.external_links},
        {"inaccessible_links", record.inaccessible_links},
        {"has_login_form", record.has_login_form},
        {"analyzed_at", format_timestamp(record.analyzed_at)},
        {"processing_time", format_duration(record.processing_time)},
    };
    for (const auto& [level, count] : record.headings) {
        json["headings"][level] = count;
    }
    if (!record.failed_passes.empty()) {
        json["failed_passes"] = record.failed_passes;
    }
}

std::string dump_json(const nlohmann::ordered_json& json) {
    return json.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string to_json(const AnalysisRecord& record) {
    return dump_json(nlohmann::ordered_json(record));
}

std::string to_json(const core::AnalysisError& error) {
    return dump_json(nlohmann::ordered_json(error));
}

} // namespace pagescope::analysis
