#pragma once
#include <pagescope/analysis/extractors.h>
#include <pagescope/analysis/link_classifier.h>
#include <pagescope/analysis/record.h>
#include <pagescope/analysis/result_cache.h>
#include <pagescope/core/config.h>
#include <pagescope/core/diagnostics.h>
#include <pagescope/core/error.h>
#include <pagescope/net/http_fetcher.h>
#include <pagescope/platform/thread_pool.h>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace pagescope::analysis {

// Per-request pipeline. Failed is absorbing and reachable from Fetching and
// Parsing only.
enum class Stage {
    Fetching,
    Parsing,
    Dispatching,
    Collecting,
    Caching,
    Done,
    Failed,
};

const char* stage_name(Stage stage);

enum class Dispatch {
    Parallel,    // one pool task per extraction pass
    Sequential,  // passes run in registry order on the calling thread
};

struct ServiceOptions {
    size_t worker_count = core::config::kDefaultWorkerCount;
    size_t queue_capacity = core::config::kDefaultQueueCapacity;
    SpecialSchemePolicy special_scheme_policy = SpecialSchemePolicy::Internal;
    // Fail the whole request (status 500) when any pass fails, instead of
    // reporting the pass in AnalysisRecord::failed_passes.
    bool fail_on_pass_error = false;
    Dispatch dispatch = Dispatch::Parallel;
    net::FetchOptions fetch;
};

struct AnalysisRequest {
    std::string url;
};

// Fetch -> parse -> dispatch -> collect -> cache. Classified failures come
// back as core::AnalysisError; only unexpected internal faults throw.
// The fetcher, cache and diagnostics must outlive the service.
class Service {
public:
    Service(net::Fetcher& fetcher, ResultCache& cache, core::DiagnosticEmitter& diagnostics,
            ServiceOptions options = {},
            ExtractorRegistry registry = ExtractorRegistry::defaults());
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    core::Result<AnalysisRecord> analyze(const AnalysisRequest& request);

    std::string status() const;

    const ServiceOptions& options() const { return options_; }
    const ExtractorRegistry& registry() const { return registry_; }

    // Stops the worker pool. Later parallel requests report every pass as
    // failed.
    void shutdown();

private:
    void transition(Stage stage, std::uint64_t cid);
    core::Result<AnalysisRecord> fail(core::AnalysisError error, std::uint64_t cid);
    void run_passes(const PassContext& ctx, AnalysisRecord& record,
                    std::vector<std::pair<std::string, std::string>>& failures,
                    std::uint64_t cid);

    net::Fetcher& fetcher_;
    ResultCache& cache_;
    core::DiagnosticEmitter& diagnostics_;
    ServiceOptions options_;
    ExtractorRegistry registry_;
    platform::ThreadPool pool_;
};

} // namespace pagescope::analysis
