#pragma once
#include <pagescope/analysis/service.h>
#include <pagescope/core/diagnostics.h>
#include <optional>
#include <string>
#include <string_view>

namespace pagescope::api {

// ============================================================================
// Request decoding
// ============================================================================

// The string "url" member of a JSON object body. nullopt for malformed JSON,
// a non-object document, or a missing or non-string url.
std::optional<std::string> request_url(std::string_view body);

// ============================================================================
// Handler
// ============================================================================

struct Response {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
};

// Transport-free front door: decides the outer status code and encodes every
// body. JSON bodies and plain-text errors both end with a newline.
class Handler {
public:
    Handler(analysis::Service& service, core::DiagnosticEmitter& diagnostics);

    // POST {"url": "..."}.
    //   405 text  "Method not allowed"     method other than POST
    //   400 text  "Invalid request body"   body is not an object with a string url
    //   400 json  {status_code,error_message,url} for a classified failure
    //   500 text  "Internal server error"  anything unexpected
    //   200 json  the analysis record
    Response analyze(std::string_view method, std::string_view body);

    Response health() const;
    Response status() const;

private:
    Response text_error(int status, const std::string& message) const;

    analysis::Service& service_;
    core::DiagnosticEmitter& diagnostics_;
};

} // namespace pagescope::api
