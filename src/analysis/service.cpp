#include <pagescope/analysis/service.h>
#include <pagescope/html/tree_builder.h>
#include <pagescope/net/status.h>
#include <pagescope/platform/task_group.h>

#include <chrono>
#include <exception>
#include <variant>

namespace pagescope::analysis {

namespace {

constexpr const char kModule[] = "service";

platform::TaskResult<PassOutput> run_inline(const ExtractionPass& pass, const PassContext& ctx) {
    platform::TaskResult<PassOutput> result;
    try {
        core::Result<PassOutput> outcome = pass.run(ctx);
        if (outcome.ok()) {
            result.value = std::move(outcome).value();
        } else {
            result.error = outcome.error().error_message;
        }
    } catch (...) {
        result.error = platform::describe_exception(std::current_exception());
    }
    return result;
}

} // namespace

const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::Fetching: return "fetch";
        case Stage::Parsing: return "parse";
        case Stage::Dispatching: return "dispatch";
        case Stage::Collecting: return "collect";
        case Stage::Caching: return "cache";
        case Stage::Done: return "done";
        case Stage::Failed: return "failed";
    }
    return "unknown";
}

Service::Service(net::Fetcher& fetcher, ResultCache& cache, core::DiagnosticEmitter& diagnostics,
                 ServiceOptions options, ExtractorRegistry registry)
    : fetcher_(fetcher),
      cache_(cache),
      diagnostics_(diagnostics),
      options_(std::move(options)),
      registry_(std::move(registry)),
      pool_(options_.worker_count, options_.queue_capacity, &diagnostics) {}

Service::~Service() {
    pool_.shutdown();
}

void Service::shutdown() {
    pool_.shutdown();
}

std::string Service::status() const {
    return "Service is running and ready for parallel webpage analysis";
}

// ============================================================================
// Pipeline
// ============================================================================

core::Result<AnalysisRecord> Service::analyze(const AnalysisRequest& request) {
    const auto started = std::chrono::steady_clock::now();
    const std::uint64_t cid = diagnostics_.next_correlation_id();
    diagnostics_.info(kModule, "request", "analyze " + request.url, cid);

    if (auto cached = cache_.get(request.url)) {
        diagnostics_.info(kModule, stage_name(Stage::Caching), "cache hit", cid);
        return std::move(*cached);
    }

    // ---- Fetching ----
    transition(Stage::Fetching, cid);
    net::FetchOutcome outcome = fetcher_.fetch(request.url, options_.fetch);
    if (const auto* err = std::get_if<net::FetchError>(&outcome)) {
        return fail(core::AnalysisError{err->status_code, err->message, request.url}, cid);
    }
    net::FetchResult response = std::move(std::get<net::FetchResult>(outcome));
    if (response.status_code != 200) {
        return fail(core::AnalysisError{response.status_code,
                                        net::describe_status(response.status_code, response.reason),
                                        request.url},
                    cid);
    }

    // ---- Parsing ----
    transition(Stage::Parsing, cid);
    auto parsed = html::parse(response.body);
    if (!parsed.ok()) {
        return fail(core::AnalysisError{response.status_code,
                                        "Failed to parse HTML: " + parsed.error().error_message,
                                        request.url},
                    cid);
    }
    const std::unique_ptr<html::Node> document = std::move(parsed).value();

    // ---- Dispatching / Collecting ----
    const LinkClassifier classifier(request.url, options_.special_scheme_policy);
    const PassContext ctx{*document, classifier};

    AnalysisRecord record;
    record.url = request.url;
    std::vector<std::pair<std::string, std::string>> failures;
    run_passes(ctx, record, failures, cid);

    if (!failures.empty() && options_.fail_on_pass_error) {
        const auto& [name, message] = failures.front();
        diagnostics_.error(kModule, stage_name(Stage::Failed),
                           "strict mode: rejecting record with " +
                               std::to_string(failures.size()) + " failed pass(es)",
                           cid);
        return core::AnalysisError{500, "Analysis pass '" + name + "' failed: " + message,
                                   request.url};
    }

    record.analyzed_at = std::chrono::system_clock::now();
    record.processing_time = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - started);

    // ---- Caching ----
    transition(Stage::Caching, cid);
    if (!record.failed_passes.empty()) {
        // Records with failed passes are never cached.
        diagnostics_.warning(kModule, stage_name(Stage::Caching),
                             "not caching record with " +
                                 std::to_string(record.failed_passes.size()) +
                                 " failed pass(es)",
                             cid);
    } else {
        try {
            cache_.set(request.url, record);
        } catch (const std::exception& e) {
            diagnostics_.warning(kModule, stage_name(Stage::Caching),
                                 std::string("cache write failed: ") + e.what(), cid);
        }
    }

    transition(Stage::Done, cid);
    return record;
}

void Service::run_passes(const PassContext& ctx, AnalysisRecord& record,
                         std::vector<std::pair<std::string, std::string>>& failures,
                         std::uint64_t cid) {
    const auto& passes = registry_.passes();
    std::vector<platform::TaskResult<PassOutput>> results;
    results.reserve(passes.size());

    transition(Stage::Dispatching, cid);
    if (options_.dispatch == Dispatch::Parallel) {
        platform::TaskGroup<PassOutput> group(pool_);
        for (const auto& pass : passes) {
            group.add(pass.name, [&pass, &ctx]() { return pass.run(ctx); });
        }
        group.execute_all();
        for (const auto& pass : passes) {
            results.push_back(group.get_result(pass.name));
        }
    } else {
        for (const auto& pass : passes) {
            results.push_back(run_inline(pass, ctx));
        }
    }

    transition(Stage::Collecting, cid);
    for (size_t i = 0; i < passes.size(); ++i) {
        const auto& result = results[i];
        if (result.ok()) {
            apply_output(*result.value, record);
            continue;
        }
        const std::string message = result.error.value_or("no result");
        diagnostics_.error(kModule, stage_name(Stage::Collecting),
                           "pass '" + passes[i].name + "' failed: " + message, cid);
        record.failed_passes.push_back(passes[i].name);
        failures.emplace_back(passes[i].name, message);
    }
}

void Service::transition(Stage stage, std::uint64_t cid) {
    diagnostics_.info(kModule, stage_name(stage), std::string("entering ") + stage_name(stage), cid);
}

core::Result<AnalysisRecord> Service::fail(core::AnalysisError error, std::uint64_t cid) {
    diagnostics_.error(kModule, stage_name(Stage::Failed), error.describe(), cid);
    return error;
}

} // namespace pagescope::analysis
