#include <pagescope/analysis/result_cache.h>
#include <pagescope/analysis/service.h>
#include <pagescope/core/diagnostics.h>
#include <pagescope/net/http_fetcher.h>

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pagescope::analysis;
using pagescope::core::AnalysisError;
using pagescope::core::DiagnosticEmitter;
using pagescope::core::Result;
using pagescope::core::Severity;
namespace net = pagescope::net;

namespace {

constexpr const char kExamplePage[] =
    "<!DOCTYPE html><html><head><title>Example Domain</title></head>"
    "<body><a href=\"/about\">x</a><a href=\"https://other.com\">y</a></body></html>";

constexpr const char kRichPage[] =
    "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Strict//EN\" \"x.dtd\">"
    "<html><head><title> Members Area </title></head><body>"
    "<h1>Welcome</h1><h2>News</h2><h2>Events</h2><H3>Old</H3>"
    "<a href=\"/home\">home</a><a href=\"#top\">top</a>"
    "<a href=\"https://EXAMPLE.com/x\">self</a><a href=\"https://cdn.example.net\">cdn</a>"
    "<a href=\"javascript:void(0)\">js</a><a>none</a><a href=\"mailto:a@b.c\">mail</a>"
    "<form action=\"/session\"><input name=\"username\"><input type=\"password\" name=\"pw\">"
    "<button>Log in</button></form>"
    "</body></html>";

// Serves one canned outcome and counts calls.
class FakeFetcher : public net::Fetcher {
public:
    explicit FakeFetcher(net::FetchOutcome outcome) : outcome_(std::move(outcome)) {}

    static FakeFetcher page(std::string body, int status = 200, std::string reason = "OK") {
        net::FetchResult result;
        result.status_code = status;
        result.reason = std::move(reason);
        result.body = std::move(body);
        return FakeFetcher(result);
    }

    net::FetchOutcome fetch(const std::string& url, const net::FetchOptions&) override {
        calls.fetch_add(1);
        last_url = url;
        return outcome_;
    }

    std::atomic<int> calls{0};
    std::string last_url;

private:
    net::FetchOutcome outcome_;
};

class ThrowingFetcher : public net::Fetcher {
public:
    net::FetchOutcome fetch(const std::string&, const net::FetchOptions&) override {
        throw std::runtime_error("socket layer exploded");
    }
};

class FailingWriteCache : public InMemoryResultCache {
public:
    void set(const std::string&, const AnalysisRecord&) override {
        throw std::runtime_error("disk full");
    }
};

std::string normalized_json(AnalysisRecord record) {
    record.analyzed_at = {};
    record.processing_time = {};
    return to_json(record);
}

} // namespace

// ============================================================================
// Happy path
// ============================================================================

// 1. The reference page yields the expected record
TEST(ServiceTest, ExamplePageEndToEnd) {
    auto fetcher = FakeFetcher::page(kExamplePage);
    InMemoryResultCache cache;
    DiagnosticEmitter diagnostics;
    Service service(fetcher, cache, diagnostics);

    auto result = service.analyze({"https://example.com"});
    ASSERT_TRUE(result.ok());
    const auto& record = result.value();
    EXPECT_EQ(record.url, "https://example.com");
    EXPECT_EQ(record.html_version, "HTML5 (implied)");
    EXPECT_EQ(record.page_title, "Example Domain");
    EXPECT_TRUE(record.headings.empty());
    EXPECT_EQ(record.internal_links, 1);
    EXPECT_EQ(record.external_links, 1);
    EXPECT_EQ(record.inaccessible_links, 0);
    EXPECT_FALSE(record.has_login_form);
    EXPECT_TRUE(record.failed_passes.empty());
    EXPECT_GT(record.processing_time.count(), 0);
    EXPECT_NE(record.analyzed_at, std::chrono::system_clock::time_point{});
    EXPECT_EQ(fetcher.last_url, "https://example.com");
}

// 2. A richer page exercises every pass
TEST(ServiceTest, RichPage) {
    auto fetcher = FakeFetcher::page(kRichPage);
    InMemoryResultCache cache;
    DiagnosticEmitter diagnostics;
    Service service(fetcher, cache, diagnostics);

    auto result = service.analyze({"https://example.com/members"});
    ASSERT_TRUE(result.ok());
    const auto& record = result.value();
    EXPECT_EQ(record.html_version, "XHTML");
    EXPECT_EQ(record.page_title, "Members Area");
    EXPECT_EQ(record.headings, (HeadingHistogram{{"h1", 1}, {"h2", 2}, {"h3", 1}}));
    EXPECT_EQ(record.internal_links, 4);
    EXPECT_EQ(record.external_links, 1);
    EXPECT_EQ(record.inaccessible_links, 2);
    EXPECT_TRUE(record.has_login_form);
}

// 3. mailto: policy is configurable
TEST(ServiceTest, MailtoExternalPolicy) {
    auto fetcher = FakeFetcher::page(kRichPage);
    InMemoryResultCache cache;
    DiagnosticEmitter diagnostics;
    ServiceOptions options;
    options.special_scheme_policy = SpecialSchemePolicy::External;
    Service service(fetcher, cache, diagnostics, options);

    auto result = service.analyze({"https://example.com/members"});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().internal_links, 3);
    EXPECT_EQ(result.value().external_links, 2);
}

// ============================================================================
// Caching
// ============================================================================

// 4. A second call is served from the cache without fetching
TEST(ServiceTest, SecondCallServedFromCache) {
    auto fetcher = FakeFetcher::page(kExamplePage);
    InMemoryResultCache cache;
    DiagnosticEmitter diagnostics;
    Service service(fetcher, cache, diagnostics);

    auto first = service.analyze({"https://example.com"});
    auto second = service.analyze({"https://example.com"});
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(fetcher.calls.load(), 1);
    EXPECT_EQ(first.value().analyzed_at, second.value().analyzed_at);
    EXPECT_TRUE(first.value() == second.value());
    EXPECT_EQ(cache.size(), 1u);
}

// 5. Cache keys are the literal request URL
TEST(ServiceTest, CacheKeyIsLiteralUrl) {
    auto fetcher = FakeFetcher::page(kExamplePage);
    InMemoryResultCache cache;
    DiagnosticEmitter diagnostics;
    Service service(fetcher, cache, diagnostics);

    ASSERT_TRUE(service.analyze({"https://example.com"}).ok());
    ASSERT_TRUE(service.analyze({"https://example.com/"}).ok());
    EXPECT_EQ(fetcher.calls.load(), 2);
}

// 6. A null cache fetches every time
TEST(ServiceTest, NullCacheAlwaysFetches) {
    auto fetcher = FakeFetcher::page(kExamplePage);
    NullResultCache cache;
    DiagnosticEmitter diagnostics;
    Service service(fetcher, cache, diagnostics);

    ASSERT_TRUE(service.analyze({"https://example.com"}).ok());
    ASSERT_TRUE(service.analyze({"https://example.com"}).ok());
    EXPECT_EQ(fetcher.calls.load(), 2);
}

// 7. Cache write failures are logged, not fatal
TEST(ServiceTest, CacheWriteFailureIsWarning) {
    auto fetcher = FakeFetcher::page(kExamplePage);
    FailingWriteCache cache;
    DiagnosticEmitter diagnostics;
    Service service(fetcher, cache, diagnostics);

    auto result = service.analyze({"https://example.com"});
    ASSERT_TRUE(result.ok());
    auto warnings = diagnostics.events_by_severity(Severity::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].message, "cache write failed: disk full");
}

// 8. Records with failed passes are not cached
TEST(ServiceTest, DegradedRecordNotCached) {
    auto fetcher = FakeFetcher::page(kExamplePage);
    InMemoryResultCache cache;
    DiagnosticEmitter diagnostics;

    // The links pass runs out of memory once, then recovers.
    auto first_run = std::make_shared<std::atomic<bool>>(true);
    ExtractorRegistry registry;
    for (const auto& pass : ExtractorRegistry::defaults().passes()) {
        if (pass.name != "links") {
            registry.add(pass);
            continue;
        }
        registry.add({pass.name, [run = pass.run, first_run](const PassContext& ctx) {
                          if (first_run->exchange(false)) throw std::bad_alloc();
                          return run(ctx);
                      }});
    }
    Service service(fetcher, cache, diagnostics, {}, registry);

    auto first = service.analyze({"https://example.com"});
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value().failed_passes, std::vector<std::string>{"links"});
    EXPECT_EQ(first.value().internal_links, 0);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(diagnostics.events_by_severity(Severity::Warning).empty());

    auto second = service.analyze({"https://example.com"});
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(fetcher.calls.load(), 2);
    EXPECT_TRUE(second.value().failed_passes.empty());
    EXPECT_EQ(second.value().internal_links, 1);
    EXPECT_EQ(cache.size(), 1u);

    ASSERT_TRUE(service.analyze({"https://example.com"}).ok());
    EXPECT_EQ(fetcher.calls.load(), 2);
}

// ============================================================================
// Failures
// ============================================================================

// 9. Fetch errors become AnalysisErrors with the request URL
TEST(ServiceTest, FetchErrorPropagates) {
    FakeFetcher fetcher(net::make_fetch_error(net::FetchErrorKind::DnsFailure, "lookup nowhere"));
    InMemoryResultCache cache;
    DiagnosticEmitter diagnostics;
    Service service(fetcher, cache, diagnostics);

    auto result = service.analyze({"https://nowhere.invalid"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().status_code, 404);
    EXPECT_EQ(result.error().url, "https://nowhere.invalid");
    EXPECT_EQ(result.error().error_message,
              "DNS resolution failed: The domain could not be found. "
              "Please check if the URL is correct.");
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(diagnostics.events_by_severity(Severity::Error).empty());
}

// 10. Non-200 responses are explained
TEST(ServiceTest, NonOkStatusExplained) {
    auto fetcher = FakeFetcher::page("<h1>Not here</h1>", 404, "Not Found");
    InMemoryResultCache cache;
    DiagnosticEmitter diagnostics;
    Service service(fetcher, cache, diagnostics);

    auto result = service.analyze({"https://example.com/missing"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().status_code, 404);
    EXPECT_EQ(result.error().error_message,
              "Page Not Found: The requested page does not exist on the server.");

    auto teapot = FakeFetcher::page("", 418, "Short and stout");
    Service other(teapot, cache, diagnostics);
    auto brewed = other.analyze({"https://example.com/tea"});
    ASSERT_FALSE(brewed.ok());
    EXPECT_EQ(brewed.error().error_message, "HTTP 418: Short and stout");
}

// 11. Unparsable payloads fail in the parse stage
TEST(ServiceTest, ParseFailure) {
    auto fetcher = FakeFetcher::page(std::string("GIF89a\0\0\0", 9));
    InMemoryResultCache cache;
    DiagnosticEmitter diagnostics;
    Service service(fetcher, cache, diagnostics);

    auto result = service.analyze({"https://example.com/image.gif"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().status_code, 200);
    EXPECT_EQ(result.error().error_message,
              "Failed to parse HTML: content contains NUL bytes and is not markup");
    EXPECT_EQ(cache.size(), 0u);
}

// 12. Unexpected exceptions escape the service
TEST(ServiceTest, UnexpectedExceptionPropagates) {
    ThrowingFetcher fetcher;
    InMemoryResultCache cache;
    DiagnosticEmitter diagnostics;
    Service service(fetcher, cache, diagnostics);
    EXPECT_THROW(service.analyze({"https://example.com"}), std::runtime_error);
}

// ============================================================================
// Pass failures and dispatch
// ============================================================================

// 13. A failing pass is reported without hiding the others
TEST(ServiceTest, FailingPassRecorded) {
    auto fetcher = FakeFetcher::page(kExamplePage);
    InMemoryResultCache cache;
    DiagnosticEmitter diagnostics;
    auto registry = ExtractorRegistry::defaults();
    registry.add({"word_count", [](const PassContext&) -> Result<PassOutput> {
        throw std::runtime_error("tokenizer table missing");
    }});
    Service service(fetcher, cache, diagnostics, {}, registry);

    auto result = service.analyze({"https://example.com"});
    ASSERT_TRUE(result.ok());
    const auto& record = result.value();
    EXPECT_EQ(record.page_title, "Example Domain");
    EXPECT_EQ(record.internal_links, 1);
    ASSERT_EQ(record.failed_passes.size(), 1u);
    EXPECT_EQ(record.failed_passes[0], "word_count");
    EXPECT_NE(to_json(record).find("\"failed_passes\":[\"word_count\"]"), std::string::npos);
}

// 14. Strict mode turns a failed pass into a request failure
TEST(ServiceTest, StrictModeFailsRequest) {
    auto fetcher = FakeFetcher::page(kExamplePage);
    InMemoryResultCache cache;
    DiagnosticEmitter diagnostics;
    auto registry = ExtractorRegistry::defaults();
    registry.add({"word_count", [](const PassContext&) -> Result<PassOutput> {
        return AnalysisError{500, "dictionary unavailable", ""};
    }});
    ServiceOptions options;
    options.fail_on_pass_error = true;
    Service service(fetcher, cache, diagnostics, options, registry);

    auto result = service.analyze({"https://example.com"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().status_code, 500);
    EXPECT_EQ(result.error().error_message,
              "Analysis pass 'word_count' failed: dictionary unavailable");
    EXPECT_EQ(cache.size(), 0u);
}

// 15. Parallel and sequential dispatch agree byte for byte
TEST(ServiceTest, ParallelMatchesSequential) {
    auto parallel_fetcher = FakeFetcher::page(kRichPage);
    auto sequential_fetcher = FakeFetcher::page(kRichPage);
    NullResultCache cache;
    DiagnosticEmitter diagnostics;

    ServiceOptions sequential_options;
    sequential_options.dispatch = Dispatch::Sequential;
    Service parallel(parallel_fetcher, cache, diagnostics);
    Service sequential(sequential_fetcher, cache, diagnostics, sequential_options);

    auto expected = sequential.analyze({"https://example.com/members"});
    ASSERT_TRUE(expected.ok());
    for (int i = 0; i < 20; ++i) {
        auto actual = parallel.analyze({"https://example.com/members"});
        ASSERT_TRUE(actual.ok());
        EXPECT_EQ(normalized_json(actual.value()), normalized_json(expected.value()));
    }
}

// 16. Sequential dispatch also isolates failing passes
TEST(ServiceTest, SequentialIsolatesFailures) {
    auto fetcher = FakeFetcher::page(kExamplePage);
    InMemoryResultCache cache;
    DiagnosticEmitter diagnostics;
    auto registry = ExtractorRegistry::defaults();
    registry.add({"broken", [](const PassContext&) -> Result<PassOutput> {
        throw std::logic_error("bad state");
    }});
    ServiceOptions options;
    options.dispatch = Dispatch::Sequential;
    Service service(fetcher, cache, diagnostics, options, registry);

    auto result = service.analyze({"https://example.com"});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().failed_passes, std::vector<std::string>{"broken"});
    EXPECT_EQ(result.value().external_links, 1);
}

// 17. After shutdown every parallel pass is reported as failed
TEST(ServiceTest, ShutdownReportsDroppedPasses) {
    auto fetcher = FakeFetcher::page(kExamplePage);
    NullResultCache cache;
    DiagnosticEmitter diagnostics;
    Service service(fetcher, cache, diagnostics);
    service.shutdown();

    auto result = service.analyze({"https://example.com"});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().failed_passes.size(), 5u);
}

// ============================================================================
// Observability and status
// ============================================================================

// 18. Stage transitions are logged under one correlation id
TEST(ServiceTest, StageTransitionsLogged) {
    auto fetcher = FakeFetcher::page(kExamplePage);
    InMemoryResultCache cache;
    DiagnosticEmitter diagnostics;
    Service service(fetcher, cache, diagnostics);
    ASSERT_TRUE(service.analyze({"https://example.com"}).ok());

    auto events = diagnostics.events_by_module("service");
    ASSERT_FALSE(events.empty());
    const auto cid = events.front().correlation_id;
    EXPECT_NE(cid, 0u);

    std::vector<std::string> stages;
    for (const auto& e : events) {
        EXPECT_EQ(e.correlation_id, cid);
        if (e.message.rfind("entering ", 0) == 0) stages.push_back(e.stage);
    }
    std::vector<std::string> expected = {"fetch", "parse", "dispatch", "collect", "cache", "done"};
    EXPECT_EQ(stages, expected);
}

// 19. Status text and stage names
TEST(ServiceTest, StatusAndStageNames) {
    auto fetcher = FakeFetcher::page(kExamplePage);
    NullResultCache cache;
    DiagnosticEmitter diagnostics;
    Service service(fetcher, cache, diagnostics);
    EXPECT_EQ(service.status(), "Service is running and ready for parallel webpage analysis");
    EXPECT_EQ(service.registry().size(), 5u);
    EXPECT_EQ(service.options().worker_count, 5u);
    EXPECT_STREQ(stage_name(Stage::Failed), "failed");
}
