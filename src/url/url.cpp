#include <pagescope/url/url.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace pagescope::url {

namespace {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::optional<uint16_t> default_port_for_scheme(std::string_view scheme) {
    if (scheme == "http")  return 80;
    if (scheme == "https") return 443;
    if (scheme == "ftp")   return 21;
    if (scheme == "ws")    return 80;
    if (scheme == "wss")   return 443;
    return std::nullopt;
}

bool is_special_scheme(std::string_view scheme) {
    return scheme == "http" || scheme == "https" ||
           scheme == "ftp" || scheme == "ws" ||
           scheme == "wss" || scheme == "file";
}

bool is_ascii_alpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

char to_lower_ascii(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<char>(c + 32);
    return c;
}

std::string lowercase(std::string_view input) {
    std::string result(input);
    std::transform(result.begin(), result.end(), result.begin(), to_lower_ascii);
    return result;
}

// Strip leading and trailing C0 control characters and spaces
std::string_view trim_input(std::string_view input) {
    size_t start = 0;
    while (start < input.size() &&
           static_cast<unsigned char>(input[start]) <= 0x20) {
        ++start;
    }
    size_t end = input.size();
    while (end > start &&
           static_cast<unsigned char>(input[end - 1]) <= 0x20) {
        --end;
    }
    return input.substr(start, end - start);
}

// Remove all ASCII tab and newline characters from input
std::string remove_tab_newline(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (char c : input) {
        if (c != '\t' && c != '\n' && c != '\r') {
            result += c;
        }
    }
    return result;
}

// Length of the scheme prefix (excluding ':'), or 0 when there is none.
size_t scheme_length(std::string_view input) {
    if (input.empty() || !is_ascii_alpha(input[0])) return 0;
    size_t end = 1;
    while (end < input.size() &&
           (is_ascii_alpha(input[end]) || is_ascii_digit(input[end]) ||
            input[end] == '+' || input[end] == '-' || input[end] == '.')) {
        ++end;
    }
    if (end < input.size() && input[end] == ':') return end;
    return 0;
}

bool is_forbidden_host_char(char c) {
    switch (c) {
        case ' ': case '#': case '%': case '/': case ':': case '<':
        case '>': case '?': case '@': case '[': case '\\': case ']':
        case '^': case '|': case '"': case '{': case '}': case '`':
            return true;
        default:
            return static_cast<unsigned char>(c) < 0x20 || c == 0x7F;
    }
}

// Resolve dot segments in a path per RFC 3986
std::string resolve_dot_segments(std::string_view path) {
    if (path.empty()) return std::string{path};

    std::vector<std::string_view> segments;
    bool has_leading_slash = path[0] == '/';
    size_t pos = has_leading_slash ? 1 : 0;
    bool trailing_slash = false;

    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string_view::npos) next = path.size();
        std::string_view segment = path.substr(pos, next - pos);
        bool last = next >= path.size();

        if (segment == ".") {
            trailing_slash = last;
        } else if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
            trailing_slash = last;
        } else {
            segments.push_back(segment);
            trailing_slash = false;
        }

        if (last) break;
        pos = next + 1;
    }

    std::string result;
    if (has_leading_slash) result += '/';
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) result += '/';
        result += segments[i];
    }
    if (trailing_slash && (result.empty() || result.back() != '/')) {
        result += '/';
    }
    return result;
}

std::string merge_paths(const URL& base, std::string_view relative_path) {
    if (!base.host.empty() && base.path.empty()) {
        return "/" + std::string(relative_path);
    }
    auto last_slash = base.path.rfind('/');
    if (last_slash != std::string::npos) {
        return base.path.substr(0, last_slash + 1) + std::string(relative_path);
    }
    return std::string(relative_path);
}

// Splits "path?query#fragment" into its three parts.
void split_tail(std::string_view rest, std::string_view& path,
                std::string_view& query, std::string_view& fragment,
                bool& has_query, bool& has_fragment) {
    auto h_pos = rest.find('#');
    has_fragment = h_pos != std::string_view::npos;
    if (has_fragment) {
        fragment = rest.substr(h_pos + 1);
        rest = rest.substr(0, h_pos);
    }
    auto q_pos = rest.find('?');
    has_query = q_pos != std::string_view::npos;
    if (has_query) {
        query = rest.substr(q_pos + 1);
        rest = rest.substr(0, q_pos);
    }
    path = rest;
}

std::optional<std::optional<uint16_t>> parse_port(std::string_view port_str,
                                                  std::string_view scheme) {
    if (port_str.empty()) {
        return std::optional<uint16_t>{std::nullopt};
    }
    uint32_t port_val = 0;
    for (char c : port_str) {
        if (!is_ascii_digit(c)) return std::nullopt;
        port_val = port_val * 10 + static_cast<uint32_t>(c - '0');
        if (port_val > 65535) return std::nullopt;
    }
    auto port = static_cast<uint16_t>(port_val);
    auto def = default_port_for_scheme(scheme);
    if (def.has_value() && def.value() == port) {
        return std::optional<uint16_t>{std::nullopt};
    }
    return std::optional<uint16_t>{port};
}

std::optional<std::string> parse_host(std::string_view host_str, bool special) {
    if (host_str.empty()) {
        return std::string{};
    }
    if (host_str.front() == '[') {
        if (host_str.size() < 3 || host_str.back() != ']') return std::nullopt;
        for (char c : host_str.substr(1, host_str.size() - 2)) {
            if (!std::isxdigit(static_cast<unsigned char>(c)) && c != ':' && c != '.') {
                return std::nullopt;
            }
        }
        return lowercase(host_str);
    }
    for (char c : host_str) {
        if (is_forbidden_host_char(c)) return std::nullopt;
    }
    return special ? lowercase(host_str) : std::string{host_str};
}

// Parses "//authority/path?query#fragment" (pos points past the "//").
bool parse_authority_and_tail(std::string_view input, URL& url) {
    size_t auth_end = 0;
    bool in_brackets = false;
    while (auth_end < input.size()) {
        char c = input[auth_end];
        if (c == '[') in_brackets = true;
        if (c == ']') in_brackets = false;
        if (!in_brackets && (c == '/' || c == '?' || c == '#' ||
                             (c == '\\' && url.is_special()))) {
            break;
        }
        ++auth_end;
    }

    std::string_view authority = input.substr(0, auth_end);
    std::string_view after = input.substr(auth_end);

    std::string_view host_port = authority;
    auto at_pos = authority.rfind('@');
    if (at_pos != std::string_view::npos) {
        std::string_view userinfo = authority.substr(0, at_pos);
        host_port = authority.substr(at_pos + 1);
        auto colon = userinfo.find(':');
        url.username = std::string(userinfo.substr(0, colon));
        if (colon != std::string_view::npos) {
            url.password = std::string(userinfo.substr(colon + 1));
        }
    }

    std::string_view host_str = host_port;
    std::string_view port_str;
    if (!host_port.empty() && host_port.front() == '[') {
        auto bracket_end = host_port.find(']');
        if (bracket_end == std::string_view::npos) return false;
        host_str = host_port.substr(0, bracket_end + 1);
        if (bracket_end + 1 < host_port.size()) {
            if (host_port[bracket_end + 1] != ':') return false;
            port_str = host_port.substr(bracket_end + 2);
        }
    } else {
        auto colon = host_port.rfind(':');
        if (colon != std::string_view::npos) {
            host_str = host_port.substr(0, colon);
            port_str = host_port.substr(colon + 1);
        }
    }

    bool special = url.is_special();
    auto host = parse_host(host_str, special);
    if (!host.has_value()) return false;
    if (special && url.scheme != "file" && host->empty()) return false;
    url.host = std::move(*host);

    auto port = parse_port(port_str, url.scheme);
    if (!port.has_value()) return false;
    url.port = *port;

    std::string_view path, query, fragment;
    bool has_query = false;
    bool has_fragment = false;
    split_tail(after, path, query, fragment, has_query, has_fragment);

    std::string normalized_path(path);
    if (special) {
        std::replace(normalized_path.begin(), normalized_path.end(), '\\', '/');
    }
    url.path = resolve_dot_segments(normalized_path);
    if (special && url.path.empty()) url.path = "/";
    if (has_query) url.query = std::string(query);
    if (has_fragment) url.fragment = std::string(fragment);
    return true;
}

} // namespace

// ---------------------------------------------------------------------------
// URL members
// ---------------------------------------------------------------------------

bool URL::is_special() const {
    return is_special_scheme(scheme);
}

std::string URL::serialize() const {
    std::string result = scheme + ':';
    if (!host.empty() || scheme == "file") {
        result += "//";
        if (!username.empty() || !password.empty()) {
            result += username;
            if (!password.empty()) {
                result += ':';
                result += password;
            }
            result += '@';
        }
        result += host;
        if (port.has_value()) {
            result += ':';
            result += std::to_string(port.value());
        }
    }
    result += path;
    if (!query.empty()) {
        result += '?';
        result += query;
    }
    if (!fragment.empty()) {
        result += '#';
        result += fragment;
    }
    return result;
}

std::string URL::origin() const {
    if (scheme == "file" || !is_special()) {
        return "null";
    }
    std::string result = scheme + "://" + host;
    if (port.has_value()) {
        result += ':';
        result += std::to_string(port.value());
    }
    return result;
}

std::string URL::hostname() const {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return lowercase(std::string_view(host).substr(1, host.size() - 2));
    }
    return lowercase(host);
}

uint16_t URL::effective_port() const {
    if (port.has_value()) return *port;
    return default_port_for_scheme(scheme).value_or(0);
}

std::string URL::request_target() const {
    std::string target = path.empty() ? "/" : path;
    if (!query.empty()) {
        target += '?';
        target += query;
    }
    return target;
}

// ---------------------------------------------------------------------------
// parse()
// ---------------------------------------------------------------------------
std::optional<URL> parse(std::string_view raw_input, const URL* base) {
    std::string input = remove_tab_newline(trim_input(raw_input));
    if (input.empty()) {
        if (base) return *base;
        return std::nullopt;
    }

    URL url;
    std::string_view sv(input);

    size_t scheme_len = scheme_length(sv);
    if (scheme_len > 0) {
        url.scheme = lowercase(sv.substr(0, scheme_len));
        std::string_view rest = sv.substr(scheme_len + 1);

        if (rest.size() >= 2 && rest[0] == '/' && rest[1] == '/') {
            if (!parse_authority_and_tail(rest.substr(2), url)) return std::nullopt;
            return url;
        }
        if (url.is_special()) {
            // "http:foo" style input: only valid as relative to a same-scheme base
            if (base && base->scheme == url.scheme && url.scheme != "file") {
                return parse(rest, base);
            }
            return std::nullopt;
        }

        // Opaque path (mailto:, tel:, data:, ...)
        std::string_view path, query, fragment;
        bool has_query = false;
        bool has_fragment = false;
        split_tail(rest, path, query, fragment, has_query, has_fragment);
        url.path = std::string(path);
        if (has_query) url.query = std::string(query);
        if (has_fragment) url.fragment = std::string(fragment);
        return url;
    }

    // No scheme: relative reference
    if (!base) {
        return std::nullopt;
    }

    url.scheme = base->scheme;

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        if (!parse_authority_and_tail(sv.substr(2), url)) return std::nullopt;
        return url;
    }

    url.username = base->username;
    url.password = base->password;
    url.host = base->host;
    url.port = base->port;

    std::string_view path, query, fragment;
    bool has_query = false;
    bool has_fragment = false;
    split_tail(sv, path, query, fragment, has_query, has_fragment);

    if (path.empty()) {
        url.path = base->path;
        url.query = has_query ? std::string(query) : base->query;
    } else {
        std::string joined = path.front() == '/' ? std::string(path) : merge_paths(*base, path);
        url.path = resolve_dot_segments(joined);
        if (has_query) url.query = std::string(query);
    }
    if (has_fragment) url.fragment = std::string(fragment);
    return url;
}

bool has_scheme(std::string_view input) {
    return scheme_length(trim_input(input)) > 0;
}

std::string scheme_of(std::string_view input) {
    auto trimmed = trim_input(input);
    return lowercase(trimmed.substr(0, scheme_length(trimmed)));
}

bool hosts_equal(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (to_lower_ascii(a[i]) != to_lower_ascii(b[i])) return false;
    }
    return true;
}

} // namespace pagescope::url
