#include <pagescope/analysis/record.h>
#include <pagescope/analysis/result_cache.h>
#include <pagescope/analysis/service.h>
#include <pagescope/api/handler.h>
#include <pagescope/core/config.h>
#include <pagescope/core/diagnostics.h>
#include <pagescope/net/http_fetcher.h>

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

constexpr const char kProgramName[] = "pagescope";

void print_usage(std::ostream& stream) {
    stream << "usage: " << kProgramName << " [options] <url> [<url>...]\n"
           << "\n"
           << "options:\n"
           << "  --timeout=SECONDS   fetch timeout (default "
           << pagescope::core::config::kDefaultFetchTimeoutSeconds << ")\n"
           << "  --workers=N         extraction worker threads (default "
           << pagescope::core::config::kDefaultWorkerCount << ")\n"
           << "  --strict            fail the request when any extraction pass fails\n"
           << "  --mailto-external   count mailto: and tel: links as external\n"
           << "  --verbose           log every pipeline stage to stderr\n"
           << "  -h, --help          show this help\n"
           << "  -V, --version       show the version\n"
           << "\n"
           << "environment:\n"
           << "  " << pagescope::core::config::kTimeoutEnvVar << ", "
           << pagescope::core::config::kWorkersEnvVar
           << "  defaults for --timeout and --workers\n";
}

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_positive_int(std::string_view text, int& value) {
    if (text.empty()) {
        return false;
    }

    int parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end || parsed <= 0) {
        return false;
    }

    value = parsed;
    return true;
}

// Reads a positive integer from the environment. Unset leaves value alone.
bool read_env_int(const char* name, int& value) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return true;
    }
    if (!parse_positive_int(raw, value)) {
        std::cerr << "Invalid " << name << ": '" << raw << "' (expected a positive integer)\n";
        return false;
    }
    return true;
}

struct CommandLine {
    int timeout_seconds = pagescope::core::config::kDefaultFetchTimeoutSeconds;
    int workers = static_cast<int>(pagescope::core::config::kDefaultWorkerCount);
    bool strict = false;
    bool mailto_external = false;
    bool verbose = false;
    bool help = false;
    bool version = false;
    std::vector<std::string> urls;
};

// Flags override the environment, which overrides the built-in defaults.
bool parse_command_line(int argc, char** argv, CommandLine& cmd) {
    if (!read_env_int(pagescope::core::config::kTimeoutEnvVar, cmd.timeout_seconds) ||
        !read_env_int(pagescope::core::config::kWorkersEnvVar, cmd.workers)) {
        return false;
    }

    for (int index = 1; index < argc; ++index) {
        const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
        if (argument == "-h" || argument == "--help") {
            cmd.help = true;
        } else if (argument == "-V" || argument == "--version") {
            cmd.version = true;
        } else if (argument == "--strict") {
            cmd.strict = true;
        } else if (argument == "--mailto-external") {
            cmd.mailto_external = true;
        } else if (argument == "--verbose") {
            cmd.verbose = true;
        } else if (starts_with(argument, "--timeout=")) {
            if (!parse_positive_int(argument.substr(10), cmd.timeout_seconds)) {
                std::cerr << "Invalid --timeout: '" << argument
                          << "' (expected --timeout=SECONDS with a positive integer)\n";
                return false;
            }
        } else if (starts_with(argument, "--workers=")) {
            if (!parse_positive_int(argument.substr(10), cmd.workers)) {
                std::cerr << "Invalid --workers: '" << argument
                          << "' (expected --workers=N with a positive integer)\n";
                return false;
            }
        } else if (starts_with(argument, "-")) {
            std::cerr << "Unknown option '" << argument << "'\n";
            return false;
        } else {
            cmd.urls.emplace_back(argument);
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    CommandLine cmd;
    if (!parse_command_line(argc, argv, cmd)) {
        print_usage(std::cerr);
        return 1;
    }
    if (cmd.help) {
        print_usage(std::cout);
        return 0;
    }
    if (cmd.version) {
        std::cout << pagescope::core::config::kVersionString << "\n";
        return 0;
    }
    if (cmd.urls.empty()) {
        print_usage(std::cerr);
        return 1;
    }

    pagescope::core::DiagnosticEmitter diagnostics;
    diagnostics.set_min_severity(cmd.verbose ? pagescope::core::Severity::Info
                                             : pagescope::core::Severity::Error);
    diagnostics.add_observer(pagescope::core::stream_observer(std::cerr));

    pagescope::analysis::ServiceOptions options;
    options.worker_count = static_cast<std::size_t>(cmd.workers);
    options.queue_capacity = options.worker_count * 2;
    options.fail_on_pass_error = cmd.strict;
    options.special_scheme_policy = cmd.mailto_external
        ? pagescope::analysis::SpecialSchemePolicy::External
        : pagescope::analysis::SpecialSchemePolicy::Internal;
    options.fetch.timeout_seconds = cmd.timeout_seconds;

    pagescope::net::HttpFetcher fetcher(&diagnostics);
    pagescope::analysis::InMemoryResultCache cache;
    pagescope::analysis::Service service(fetcher, cache, diagnostics, options);
    pagescope::api::Handler handler(service, diagnostics);

    int exit_code = 0;
    for (const auto& url : cmd.urls) {
        const std::string body = pagescope::analysis::dump_json(nlohmann::ordered_json{{"url", url}});
        const pagescope::api::Response response = handler.analyze("POST", body);
        std::cout << response.body;
        if (response.status != 200) {
            exit_code = 1;
        }
    }
    return exit_code;
}
