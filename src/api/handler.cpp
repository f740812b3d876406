#include <pagescope/api/handler.h>
#include <pagescope/analysis/record.h>
#include <pagescope/core/config.h>

#include <nlohmann/json.hpp>

#include <exception>
#include <utility>

namespace pagescope::api {

namespace {

constexpr const char kModule[] = "api";

Response json_response(int status, std::string body) {
    Response response;
    response.status = status;
    response.body = std::move(body) + "\n";
    return response;
}

} // namespace

std::optional<std::string> request_url(std::string_view body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    const auto it = json.find("url");
    if (it == json.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// ============================================================================
// Handler
// ============================================================================

Handler::Handler(analysis::Service& service, core::DiagnosticEmitter& diagnostics)
    : service_(service), diagnostics_(diagnostics) {}

Response Handler::analyze(std::string_view method, std::string_view body) {
    if (method != "POST") {
        diagnostics_.warning(kModule, "analyze",
                             "method " + std::string(method) + " not allowed, expected POST");
        return text_error(405, "Method not allowed");
    }

    auto url = request_url(body);
    if (!url) {
        return text_error(400, "Invalid request body");
    }

    analysis::AnalysisRequest request{std::move(*url)};
    try {
        auto result = service_.analyze(request);
        if (!result.ok()) {
            const auto& error = result.error();
            diagnostics_.warning(kModule, "analyze", "analysis failed: " + error.describe());
            return json_response(400, analysis::to_json(error));
        }
        const auto& record = result.value();
        diagnostics_.info(kModule, "analyze",
                          "analyzed " + record.url + " in " +
                              analysis::format_duration(record.processing_time));
        return json_response(200, analysis::to_json(record));
    } catch (const std::exception& e) {
        diagnostics_.error(kModule, "analyze", std::string("internal error: ") + e.what());
        return text_error(500, "Internal server error");
    }
}

Response Handler::health() const {
    const nlohmann::ordered_json body{{"status", "healthy"},
                                      {"service", core::config::kServiceName}};
    return json_response(200, analysis::dump_json(body));
}

Response Handler::status() const {
    const nlohmann::ordered_json body{{"status", service_.status()}};
    return json_response(200, analysis::dump_json(body));
}

Response Handler::text_error(int status, const std::string& message) const {
    diagnostics_.warning(kModule, "response",
                         "HTTP " + std::to_string(status) + ": " + message);
    Response response;
    response.status = status;
    response.content_type = "text/plain; charset=utf-8";
    response.body = message + "\n";
    return response;
}

} // namespace pagescope::api
