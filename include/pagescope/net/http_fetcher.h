#pragma once
#include <pagescope/core/config.h>
#include <pagescope/core/diagnostics.h>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace pagescope::net {

enum class FetchErrorKind {
    InvalidUrl,
    UnsupportedScheme,
    DnsFailure,
    ConnectionRefused,
    Timeout,
    TlsFailure,
    NetworkUnreachable,
    Protocol,
    Other,
};

const char* fetch_error_kind_name(FetchErrorKind kind);

// HTTP-like status code reported for a transport failure.
int status_code_for(FetchErrorKind kind);

struct FetchError {
    FetchErrorKind kind = FetchErrorKind::Other;
    int status_code = 503;
    std::string message;  // human-readable, shown to the caller
    std::string detail;   // low-level cause, for logs
};

// Builds the error for kind, with the fixed human-readable message.
FetchError make_fetch_error(FetchErrorKind kind, const std::string& detail = {});

// Maps a socket-level errno to a transport failure kind.
FetchErrorKind classify_errno(int error_number);

struct FetchResult {
    int status_code = 0;
    std::string reason;
    std::map<std::string, std::string> headers;  // lowercased names
    std::string body;                             // decoded (de-chunked, inflated)
    std::string final_url;
};

using FetchOutcome = std::variant<FetchResult, FetchError>;

struct FetchOptions {
    int timeout_seconds = core::config::kDefaultFetchTimeoutSeconds;
    int max_redirects = core::config::kDefaultMaxRedirects;
    std::size_t max_body_bytes = core::config::kMaxResponseBytes;
};

// Fetch collaborator: raw bytes plus status code, or a typed fetch error.
// Non-2xx responses are results, not errors.
class Fetcher {
public:
    virtual ~Fetcher() = default;
    virtual FetchOutcome fetch(const std::string& url, const FetchOptions& options) = 0;
};

// HTTP/1.1 client over POSIX sockets, with OpenSSL for https and zlib for
// gzip/deflate bodies. One connection per request ("Connection: close").
class HttpFetcher : public Fetcher {
public:
    // diagnostics may be null; when set it must outlive the fetcher.
    explicit HttpFetcher(core::DiagnosticEmitter* diagnostics = nullptr);

    FetchOutcome fetch(const std::string& url, const FetchOptions& options) override;

private:
    core::DiagnosticEmitter* diagnostics_;
};

// ---- Pure helpers, exposed for testing ----

// Rejects empty, relative, or non-http(s) input before any network work.
std::optional<FetchError> validate_url(const std::string& url);

struct ResponseHead {
    std::string http_version;
    int status_code = 0;
    std::string reason;
    std::map<std::string, std::string> headers;  // lowercased names, repeats joined by ","
};

// Parses the status line and header block (without the final blank line).
bool parse_response_head(const std::string& block, ResponseHead& head, std::string& err);

enum class ChunkedStatus { Complete, NeedMore, Error };

// Decodes a chunked body held entirely in data. NeedMore means data ends
// before the terminating zero-size chunk.
ChunkedStatus decode_chunked(std::string_view data, std::string& output, std::string& err);

// Inflates gzip, zlib-wrapped or raw deflate data. Returns false when the
// input is none of those.
bool inflate_body(const std::string& compressed, std::string& output);

// GET request bytes for target, including the fixed request headers.
std::string build_request(const std::string& host_header, const std::string& target);

} // namespace pagescope::net
