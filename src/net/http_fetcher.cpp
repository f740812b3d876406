#include <pagescope/net/http_fetcher.h>
#include <pagescope/net/status.h>
#include <pagescope/url/url.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <limits>
#include <mutex>
#include <vector>

namespace pagescope::net {

namespace {

constexpr std::size_t kReadBufferSize = 8192;

using Clock = std::chrono::steady_clock;

struct Failure {
    FetchErrorKind kind = FetchErrorKind::Other;
    std::string detail;
};

std::string to_lower_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim_ascii(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

void note(core::DiagnosticEmitter* diagnostics, core::Severity severity,
          const std::string& stage, const std::string& message) {
    if (diagnostics) {
        diagnostics->emit(severity, "net", stage, message);
    }
}

bool is_ip_literal(const std::string& host) {
    unsigned char buf[sizeof(in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

int seconds_until(Clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(deadline - Clock::now());
    return std::max<int>(1, static_cast<int>(remaining.count()));
}

// ============================================================================
// Socket setup
// ============================================================================

bool set_nonblocking(int fd, bool nonblocking, Failure& failure) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        failure = {FetchErrorKind::Other, "fcntl(F_GETFL) failed: " + std::string(std::strerror(errno))};
        return false;
    }
    const int target_flags = nonblocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (fcntl(fd, F_SETFL, target_flags) < 0) {
        failure = {FetchErrorKind::Other, "fcntl(F_SETFL) failed: " + std::string(std::strerror(errno))};
        return false;
    }
    return true;
}

bool set_socket_timeouts(int fd, int timeout_seconds, Failure& failure) {
    timeval timeout{};
    timeout.tv_sec = timeout_seconds;
    timeout.tv_usec = 0;

    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0 ||
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) < 0) {
        failure = {FetchErrorKind::Other, "setsockopt() failed: " + std::string(std::strerror(errno))};
        return false;
    }
    return true;
}

int connect_tcp(const std::string& host, int port, int timeout_seconds, Failure& failure) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    const std::string port_str = std::to_string(port);
    const int gai_rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results);
    if (gai_rc != 0) {
        failure = {FetchErrorKind::DnsFailure,
                   "lookup " + host + ": " + std::string(gai_strerror(gai_rc))};
        return -1;
    }

    int connected_fd = -1;
    Failure last_failure{FetchErrorKind::Other, "Unable to connect"};

    for (addrinfo* addr = results; addr != nullptr; addr = addr->ai_next) {
        int fd = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
        if (fd < 0) {
            last_failure = {FetchErrorKind::Other, "socket() failed: " + std::string(std::strerror(errno))};
            continue;
        }

        Failure step_failure;
        if (!set_nonblocking(fd, true, step_failure)) {
            last_failure = step_failure;
            close(fd);
            continue;
        }

        int rc = connect(fd, addr->ai_addr, addr->ai_addrlen);
        if (rc < 0 && errno != EINPROGRESS) {
            last_failure = {classify_errno(errno), "connect: " + std::string(std::strerror(errno))};
            close(fd);
            continue;
        }

        if (rc < 0) {
            fd_set write_set;
            FD_ZERO(&write_set);
            FD_SET(fd, &write_set);

            timeval timeout{};
            timeout.tv_sec = timeout_seconds;
            timeout.tv_usec = 0;

            rc = select(fd + 1, nullptr, &write_set, nullptr, &timeout);
            if (rc == 0) {
                last_failure = {FetchErrorKind::Timeout, "connect: timed out"};
                close(fd);
                continue;
            }
            if (rc < 0) {
                last_failure = {FetchErrorKind::Other,
                                "select() failed while connecting: " + std::string(std::strerror(errno))};
                close(fd);
                continue;
            }

            int socket_error = 0;
            socklen_t socket_error_len = sizeof(socket_error);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &socket_error, &socket_error_len) < 0) {
                last_failure = {FetchErrorKind::Other,
                                "getsockopt(SO_ERROR) failed: " + std::string(std::strerror(errno))};
                close(fd);
                continue;
            }
            if (socket_error != 0) {
                last_failure = {classify_errno(socket_error),
                                "connect: " + std::string(std::strerror(socket_error))};
                close(fd);
                continue;
            }
        }

        if (!set_nonblocking(fd, false, step_failure) ||
            !set_socket_timeouts(fd, timeout_seconds, step_failure)) {
            last_failure = step_failure;
            close(fd);
            continue;
        }

        connected_fd = fd;
        break;
    }

    freeaddrinfo(results);

    if (connected_fd < 0) {
        failure = last_failure;
    }
    return connected_fd;
}

void init_openssl_once() {
    static std::once_flag once;
    std::call_once(once, []() {
        OPENSSL_init_ssl(0, nullptr);
    });
}

// ============================================================================
// Connection
// ============================================================================

class Connection {
public:
    explicit Connection(Clock::time_point deadline) : deadline_(deadline) {}

    ~Connection() {
        close_connection();
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    bool open(const url::URL& target, Failure& failure) {
        const std::string host = target.hostname();
        fd_ = connect_tcp(host, target.effective_port(), seconds_until(deadline_), failure);
        if (fd_ < 0) {
            return false;
        }
        if (target.scheme != "https") {
            return true;
        }

        init_openssl_once();

        ssl_ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ssl_ctx_) {
            failure = {FetchErrorKind::TlsFailure, "tls: SSL_CTX_new() failed"};
            return false;
        }
        SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(ssl_ctx_) != 1) {
            failure = {FetchErrorKind::TlsFailure, "tls: cannot load default certificate paths"};
            return false;
        }

        ssl_ = SSL_new(ssl_ctx_);
        if (!ssl_) {
            failure = {FetchErrorKind::TlsFailure, "tls: SSL_new() failed"};
            return false;
        }

        const bool ip_host = is_ip_literal(host);
        if (!ip_host) {
            SSL_set_tlsext_host_name(ssl_, host.c_str());
        }
        SSL_set_fd(ssl_, fd_);

        while (true) {
            const int rc = SSL_connect(ssl_);
            if (rc == 1) {
                use_ssl_ = true;
                break;
            }
            const int ssl_error = SSL_get_error(ssl_, rc);
            if ((ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) &&
                Clock::now() < deadline_) {
                continue;
            }
            if (Clock::now() >= deadline_) {
                failure = {FetchErrorKind::Timeout, "tls handshake timeout"};
                return false;
            }
            const long verify = SSL_get_verify_result(ssl_);
            if (verify != X509_V_OK) {
                failure = {FetchErrorKind::TlsFailure,
                           "tls: failed to verify certificate: " +
                               std::string(X509_verify_cert_error_string(verify))};
            } else {
                failure = {FetchErrorKind::TlsFailure, "tls: handshake failed"};
            }
            return false;
        }

        X509* peer_cert = SSL_get_peer_certificate(ssl_);
        if (!peer_cert) {
            failure = {FetchErrorKind::TlsFailure, "tls: missing peer certificate"};
            return false;
        }
        const int host_ok = ip_host
            ? X509_check_ip_asc(peer_cert, host.c_str(), 0)
            : X509_check_host(peer_cert, host.c_str(), host.size(), 0, nullptr);
        X509_free(peer_cert);
        if (host_ok != 1) {
            failure = {FetchErrorKind::TlsFailure, "tls: certificate is not valid for " + host};
            return false;
        }
        return true;
    }

    bool write_all(const std::string& data, Failure& failure) {
        std::size_t written = 0;
        while (written < data.size()) {
            if (Clock::now() >= deadline_) {
                failure = {FetchErrorKind::Timeout, "write: deadline exceeded"};
                return false;
            }
            if (use_ssl_) {
                const int chunk = static_cast<int>(std::min<std::size_t>(data.size() - written, 1 << 20));
                const int rc = SSL_write(ssl_, data.data() + written, chunk);
                if (rc > 0) {
                    written += static_cast<std::size_t>(rc);
                    continue;
                }
                const int ssl_error = SSL_get_error(ssl_, rc);
                if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) {
                    continue;
                }
                failure = {FetchErrorKind::TlsFailure, "tls: write failed"};
                return false;
            }

            const ssize_t rc = send(fd_, data.data() + written, data.size() - written, MSG_NOSIGNAL);
            if (rc > 0) {
                written += static_cast<std::size_t>(rc);
                continue;
            }
            if (rc < 0 && errno == EINTR) {
                continue;
            }
            if (rc == 0) {
                failure = {FetchErrorKind::Protocol, "connection closed while writing request"};
            } else {
                failure = {classify_errno(errno), "write: " + std::string(std::strerror(errno))};
            }
            return false;
        }
        return true;
    }

    // Appends whatever is available to buffer; sets eof on orderly close.
    bool read_some(std::string& buffer, bool& eof, Failure& failure) {
        eof = false;
        char temp[kReadBufferSize];

        while (true) {
            if (Clock::now() >= deadline_) {
                failure = {FetchErrorKind::Timeout, "read: deadline exceeded"};
                return false;
            }
            if (use_ssl_) {
                const int rc = SSL_read(ssl_, temp, static_cast<int>(sizeof(temp)));
                if (rc > 0) {
                    buffer.append(temp, static_cast<std::size_t>(rc));
                    return true;
                }
                const int ssl_error = SSL_get_error(ssl_, rc);
                if (ssl_error == SSL_ERROR_ZERO_RETURN) {
                    eof = true;
                    return true;
                }
                if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) {
                    continue;
                }
                if (ssl_error == SSL_ERROR_SYSCALL && rc == 0) {
                    // Peer closed without close_notify; treat as end of stream
                    eof = true;
                    return true;
                }
                failure = {FetchErrorKind::TlsFailure, "tls: read failed"};
                return false;
            }

            const ssize_t rc = recv(fd_, temp, sizeof(temp), 0);
            if (rc > 0) {
                buffer.append(temp, static_cast<std::size_t>(rc));
                return true;
            }
            if (rc == 0) {
                eof = true;
                return true;
            }
            if (errno == EINTR) {
                continue;
            }
            failure = {classify_errno(errno), "read: " + std::string(std::strerror(errno))};
            return false;
        }
    }

private:
    void close_connection() {
        if (ssl_) {
            if (use_ssl_) {
                SSL_shutdown(ssl_);
            }
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
        if (ssl_ctx_) {
            SSL_CTX_free(ssl_ctx_);
            ssl_ctx_ = nullptr;
        }
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
        use_ssl_ = false;
    }

    Clock::time_point deadline_;
    int fd_ = -1;
    bool use_ssl_ = false;
    SSL_CTX* ssl_ctx_ = nullptr;
    SSL* ssl_ = nullptr;
};

// ============================================================================
// One request/response exchange
// ============================================================================

bool parse_content_length(const std::string& raw, std::size_t& content_length) {
    const std::string value = trim_ascii(raw);
    if (value.empty()) {
        return false;
    }
    std::size_t result = 0;
    for (char ch : value) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
        const auto digit = static_cast<std::size_t>(ch - '0');
        if (result > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
            return false;
        }
        result = result * 10 + digit;
    }
    content_length = result;
    return true;
}

std::string host_header(const url::URL& target) {
    std::string header = target.host;
    if (target.port.has_value()) {
        header += ':' + std::to_string(*target.port);
    }
    return header;
}

FetchOutcome fetch_once(const url::URL& target, const FetchOptions& options,
                        Clock::time_point deadline, core::DiagnosticEmitter* diagnostics) {
    Connection connection(deadline);
    Failure failure;

    if (!connection.open(target, failure)) {
        return make_fetch_error(failure.kind, failure.detail);
    }
    if (!connection.write_all(build_request(host_header(target), target.request_target()), failure)) {
        return make_fetch_error(failure.kind, failure.detail);
    }

    std::string buffer;
    bool eof = false;
    ResponseHead head;

    // Read the head, skipping interim 1xx responses
    while (true) {
        const std::size_t headers_end = buffer.find("\r\n\r\n");
        if (headers_end == std::string::npos) {
            if (buffer.size() > core::config::kMaxHeaderBytes) {
                return make_fetch_error(FetchErrorKind::Protocol, "response headers exceed maximum size");
            }
            if (eof) {
                return make_fetch_error(FetchErrorKind::Protocol,
                                        "unexpected EOF while reading response headers");
            }
            if (!connection.read_some(buffer, eof, failure)) {
                return make_fetch_error(failure.kind, failure.detail);
            }
            continue;
        }

        std::string err;
        if (!parse_response_head(buffer.substr(0, headers_end), head, err)) {
            return make_fetch_error(FetchErrorKind::Protocol, err);
        }
        buffer.erase(0, headers_end + 4);
        if (head.status_code >= 100 && head.status_code < 200 && head.status_code != 101) {
            continue;
        }
        break;
    }

    FetchResult result;
    result.status_code = head.status_code;
    result.reason = head.reason;
    result.headers = head.headers;

    auto body_too_large = [&](std::size_t size) { return size > options.max_body_bytes; };

    const bool no_body = head.status_code == 204 || head.status_code == 304;
    const auto transfer_it = head.headers.find("transfer-encoding");
    const auto length_it = head.headers.find("content-length");

    if (no_body) {
        // nothing to read
    } else if (transfer_it != head.headers.end() &&
               to_lower_ascii(transfer_it->second).find("chunked") != std::string::npos) {
        while (true) {
            std::string err;
            const ChunkedStatus status = decode_chunked(buffer, result.body, err);
            if (status == ChunkedStatus::Complete) break;
            if (status == ChunkedStatus::Error) {
                return make_fetch_error(FetchErrorKind::Protocol, err);
            }
            if (eof) {
                return make_fetch_error(FetchErrorKind::Protocol, "unexpected EOF in chunked body");
            }
            if (body_too_large(buffer.size())) {
                return make_fetch_error(FetchErrorKind::Protocol, "response body exceeds size limit");
            }
            if (!connection.read_some(buffer, eof, failure)) {
                return make_fetch_error(failure.kind, failure.detail);
            }
        }
    } else if (length_it != head.headers.end()) {
        std::size_t content_length = 0;
        if (!parse_content_length(length_it->second, content_length)) {
            return make_fetch_error(FetchErrorKind::Protocol, "invalid Content-Length header");
        }
        if (body_too_large(content_length)) {
            return make_fetch_error(FetchErrorKind::Protocol, "response body exceeds size limit");
        }
        while (buffer.size() < content_length) {
            if (eof) {
                return make_fetch_error(FetchErrorKind::Protocol, "unexpected EOF in response body");
            }
            if (!connection.read_some(buffer, eof, failure)) {
                return make_fetch_error(failure.kind, failure.detail);
            }
        }
        buffer.resize(content_length);
        result.body = std::move(buffer);
    } else {
        while (!eof) {
            if (body_too_large(buffer.size())) {
                return make_fetch_error(FetchErrorKind::Protocol, "response body exceeds size limit");
            }
            if (!connection.read_some(buffer, eof, failure)) {
                return make_fetch_error(failure.kind, failure.detail);
            }
        }
        result.body = std::move(buffer);
    }

    const auto encoding_it = head.headers.find("content-encoding");
    if (encoding_it != head.headers.end() && !result.body.empty()) {
        const std::string encoding = to_lower_ascii(trim_ascii(encoding_it->second));
        if (encoding == "gzip" || encoding == "x-gzip" || encoding == "deflate") {
            std::string inflated;
            if (inflate_body(result.body, inflated)) {
                result.body = std::move(inflated);
            } else {
                note(diagnostics, core::Severity::Warning, "decode",
                     "could not inflate " + encoding + " body; using raw bytes");
            }
        }
    }

    return result;
}

} // namespace

// ============================================================================
// Error taxonomy
// ============================================================================

const char* fetch_error_kind_name(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::InvalidUrl:         return "invalid_url";
        case FetchErrorKind::UnsupportedScheme:  return "unsupported_scheme";
        case FetchErrorKind::DnsFailure:         return "dns_failure";
        case FetchErrorKind::ConnectionRefused:  return "connection_refused";
        case FetchErrorKind::Timeout:            return "timeout";
        case FetchErrorKind::TlsFailure:         return "tls_failure";
        case FetchErrorKind::NetworkUnreachable: return "network_unreachable";
        case FetchErrorKind::Protocol:           return "protocol";
        case FetchErrorKind::Other:              return "other";
    }
    return "unknown";
}

int status_code_for(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::InvalidUrl:         return 400;
        case FetchErrorKind::UnsupportedScheme:  return 400;
        case FetchErrorKind::DnsFailure:         return 404;
        case FetchErrorKind::ConnectionRefused:  return 503;
        case FetchErrorKind::Timeout:            return 408;
        case FetchErrorKind::TlsFailure:         return 495;
        case FetchErrorKind::NetworkUnreachable: return 503;
        case FetchErrorKind::Protocol:           return 502;
        case FetchErrorKind::Other:              return 503;
    }
    return 503;
}

FetchError make_fetch_error(FetchErrorKind kind, const std::string& detail) {
    FetchError error;
    error.kind = kind;
    error.status_code = status_code_for(kind);
    error.detail = detail;

    switch (kind) {
        case FetchErrorKind::InvalidUrl:
            error.message = "Invalid URL format: " + detail +
                            ". Please provide an absolute http:// or https:// URL.";
            break;
        case FetchErrorKind::UnsupportedScheme:
            error.message = "Protocol error: The URL uses an unsupported protocol. "
                            "Please use http:// or https://.";
            break;
        case FetchErrorKind::DnsFailure:
            error.message = "DNS resolution failed: The domain could not be found. "
                            "Please check if the URL is correct.";
            break;
        case FetchErrorKind::ConnectionRefused:
            error.message = "Connection refused: The server is not accepting connections. "
                            "The service might be down or the port might be closed.";
            break;
        case FetchErrorKind::Timeout:
            error.message = "Request timeout: The server took too long to respond. "
                            "Please try again later.";
            break;
        case FetchErrorKind::TlsFailure:
            error.message = "SSL/TLS error: There was a problem with the security certificate. "
                            "The connection is not secure.";
            break;
        case FetchErrorKind::NetworkUnreachable:
            error.message = "Network unreachable: Cannot reach the server. "
                            "Please check your internet connection.";
            break;
        case FetchErrorKind::Protocol:
            error.message = "Protocol error: The server sent an invalid HTTP response (" +
                            detail + ").";
            break;
        case FetchErrorKind::Other:
            error.message = "Network error: " + detail +
                            ". Please check your internet connection and try again.";
            break;
    }
    return error;
}

FetchErrorKind classify_errno(int error_number) {
    if (error_number == ECONNREFUSED || error_number == ECONNRESET) {
        return FetchErrorKind::ConnectionRefused;
    }
    if (error_number == ETIMEDOUT || error_number == EAGAIN ||
        error_number == EWOULDBLOCK || error_number == EINPROGRESS) {
        return FetchErrorKind::Timeout;
    }
    if (error_number == ENETUNREACH || error_number == EHOSTUNREACH ||
        error_number == ENETDOWN || error_number == EHOSTDOWN) {
        return FetchErrorKind::NetworkUnreachable;
    }
    return FetchErrorKind::Other;
}

// ============================================================================
// Pure helpers
// ============================================================================

std::optional<FetchError> validate_url(const std::string& raw) {
    const std::string trimmed = trim_ascii(raw);
    if (trimmed.empty()) {
        return make_fetch_error(FetchErrorKind::InvalidUrl, "empty URL");
    }
    if (!url::has_scheme(trimmed)) {
        return make_fetch_error(FetchErrorKind::InvalidUrl, "missing scheme in \"" + trimmed + "\"");
    }
    const std::string scheme = url::scheme_of(trimmed);
    if (scheme != "http" && scheme != "https") {
        return make_fetch_error(FetchErrorKind::UnsupportedScheme,
                                "unsupported protocol scheme \"" + scheme + "\"");
    }
    auto parsed = url::parse(trimmed);
    if (!parsed.has_value() || parsed->host.empty()) {
        return make_fetch_error(FetchErrorKind::InvalidUrl, "malformed URL \"" + trimmed + "\"");
    }
    return std::nullopt;
}

bool parse_response_head(const std::string& block, ResponseHead& head, std::string& err) {
    head = ResponseHead{};

    const std::size_t first_crlf = block.find("\r\n");
    const std::string status_line = block.substr(0, first_crlf);

    const std::size_t first_space = status_line.find(' ');
    if (first_space == std::string::npos || status_line.compare(0, 5, "HTTP/") != 0) {
        err = "malformed HTTP status line";
        return false;
    }
    head.http_version = status_line.substr(0, first_space);

    const std::size_t second_space = status_line.find(' ', first_space + 1);
    const std::string code_str = (second_space == std::string::npos)
        ? status_line.substr(first_space + 1)
        : status_line.substr(first_space + 1, second_space - first_space - 1);
    if (code_str.size() != 3 ||
        !std::all_of(code_str.begin(), code_str.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        err = "invalid HTTP status code";
        return false;
    }
    head.status_code = std::stoi(code_str);
    head.reason = (second_space == std::string::npos)
        ? std::string{}
        : trim_ascii(status_line.substr(second_space + 1));

    if (first_crlf == std::string::npos) {
        return true;
    }

    std::size_t offset = first_crlf + 2;
    while (offset < block.size()) {
        const std::size_t next_crlf = block.find("\r\n", offset);
        const std::string line = (next_crlf == std::string::npos)
            ? block.substr(offset)
            : block.substr(offset, next_crlf - offset);
        offset = (next_crlf == std::string::npos) ? block.size() : next_crlf + 2;

        if (line.empty()) break;
        const std::size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        const std::string name = to_lower_ascii(trim_ascii(line.substr(0, colon)));
        const std::string value = trim_ascii(line.substr(colon + 1));
        if (name.empty()) continue;

        auto it = head.headers.find(name);
        if (it == head.headers.end()) {
            head.headers.emplace(name, value);
        } else {
            it->second.append(",");
            it->second.append(value);
        }
    }
    return true;
}

ChunkedStatus decode_chunked(std::string_view data, std::string& output, std::string& err) {
    output.clear();
    std::size_t pos = 0;

    while (true) {
        const std::size_t eol = data.find("\r\n", pos);
        if (eol == std::string_view::npos) {
            return ChunkedStatus::NeedMore;
        }

        std::string size_line(data.substr(pos, eol - pos));
        const std::size_t semicolon = size_line.find(';');
        const std::string hex_size = trim_ascii(size_line.substr(0, semicolon));
        if (hex_size.empty() || hex_size.size() > 15) {
            err = "invalid chunk size line";
            return ChunkedStatus::Error;
        }

        std::size_t chunk_size = 0;
        for (char ch : hex_size) {
            int digit = 0;
            if (ch >= '0' && ch <= '9') {
                digit = ch - '0';
            } else if (ch >= 'a' && ch <= 'f') {
                digit = 10 + (ch - 'a');
            } else if (ch >= 'A' && ch <= 'F') {
                digit = 10 + (ch - 'A');
            } else {
                err = "invalid chunk size value";
                return ChunkedStatus::Error;
            }
            chunk_size = chunk_size * 16 + static_cast<std::size_t>(digit);
        }
        pos = eol + 2;

        if (chunk_size == 0) {
            // Trailer section ends with an empty line
            while (true) {
                const std::size_t trailer_end = data.find("\r\n", pos);
                if (trailer_end == std::string_view::npos) {
                    return ChunkedStatus::NeedMore;
                }
                if (trailer_end == pos) {
                    return ChunkedStatus::Complete;
                }
                pos = trailer_end + 2;
            }
        }

        if (data.size() - pos < chunk_size + 2) {
            return ChunkedStatus::NeedMore;
        }
        output.append(data.substr(pos, chunk_size));
        if (data[pos + chunk_size] != '\r' || data[pos + chunk_size + 1] != '\n') {
            err = "malformed chunk terminator";
            return ChunkedStatus::Error;
        }
        pos += chunk_size + 2;
    }
}

namespace {

// Try to inflate data with a specific windowBits setting.
bool try_inflate(const std::string& compressed, int window_bits, std::string& output) {
    z_stream strm{};
    if (inflateInit2(&strm, window_bits) != Z_OK) return false;

    strm.avail_in = static_cast<uInt>(compressed.size());
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));

    output.clear();
    output.reserve(compressed.size() * 4);

    unsigned char buffer[32768];
    int ret;
    do {
        strm.avail_out = sizeof(buffer);
        strm.next_out = buffer;
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR ||
            ret == Z_MEM_ERROR || ret == Z_NEED_DICT || ret == Z_BUF_ERROR) {
            inflateEnd(&strm);
            return false;
        }
        const std::size_t have = sizeof(buffer) - strm.avail_out;
        output.append(reinterpret_cast<const char*>(buffer), have);
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return true;
}

} // namespace

bool inflate_body(const std::string& compressed, std::string& output) {
    if (compressed.empty()) {
        output.clear();
        return true;
    }
    // 15 + 32 enables automatic gzip / zlib-wrapped deflate detection
    if (try_inflate(compressed, 15 + 32, output)) {
        return true;
    }
    // Raw deflate, sent by some servers under Content-Encoding: deflate
    return try_inflate(compressed, -15, output);
}

std::string build_request(const std::string& host, const std::string& target) {
    std::string request;
    request.reserve(512);
    request += "GET " + target + " HTTP/1.1\r\n";
    request += "Host: " + host + "\r\n";
    request += std::string("User-Agent: ") + core::config::kUserAgent + "\r\n";
    request += std::string("Accept: ") + core::config::kAcceptHeader + "\r\n";
    request += std::string("Accept-Language: ") + core::config::kAcceptLanguageHeader + "\r\n";
    request += std::string("Accept-Encoding: ") + core::config::kAcceptEncodingHeader + "\r\n";
    request += "Connection: close\r\n";
    request += "\r\n";
    return request;
}

// ============================================================================
// HttpFetcher
// ============================================================================

HttpFetcher::HttpFetcher(core::DiagnosticEmitter* diagnostics)
    : diagnostics_(diagnostics) {}

FetchOutcome HttpFetcher::fetch(const std::string& raw_url, const FetchOptions& options) {
    if (auto invalid = validate_url(raw_url)) {
        note(diagnostics_, core::Severity::Warning, "validate", invalid->detail);
        return *invalid;
    }

    auto current = url::parse(trim_ascii(raw_url));
    const int timeout_seconds = options.timeout_seconds > 0
        ? options.timeout_seconds
        : core::config::kDefaultFetchTimeoutSeconds;
    const auto deadline = Clock::now() + std::chrono::seconds(timeout_seconds);
    const int max_redirects = std::max(0, options.max_redirects);

    for (int redirect_count = 0;; ++redirect_count) {
        note(diagnostics_, core::Severity::Info, "request", "GET " + current->serialize());

        FetchOutcome outcome = fetch_once(*current, options, deadline, diagnostics_);
        if (auto* error = std::get_if<FetchError>(&outcome)) {
            note(diagnostics_, core::Severity::Warning, "response",
                 std::string(fetch_error_kind_name(error->kind)) + ": " + error->detail);
            return outcome;
        }

        auto& result = std::get<FetchResult>(outcome);
        result.final_url = current->serialize();

        const auto location_it = result.headers.find("location");
        if (!is_redirect_status(result.status_code) || location_it == result.headers.end() ||
            trim_ascii(location_it->second).empty()) {
            note(diagnostics_, core::Severity::Info, "response",
                 std::to_string(result.status_code) + " " + result.reason + " (" +
                     std::to_string(result.body.size()) + " bytes)");
            return outcome;
        }

        if (redirect_count >= max_redirects) {
            return make_fetch_error(FetchErrorKind::Other,
                                    "stopped after " + std::to_string(max_redirects) + " redirects");
        }

        auto next = url::parse(trim_ascii(location_it->second), &*current);
        if (!next.has_value() || (next->scheme != "http" && next->scheme != "https") ||
            next->host.empty()) {
            return make_fetch_error(FetchErrorKind::Protocol,
                                    "invalid redirect location '" + location_it->second + "'");
        }

        note(diagnostics_, core::Severity::Info, "redirect",
             std::to_string(result.status_code) + " -> " + next->serialize());
        current = std::move(next);
    }
}

} // namespace pagescope::net
