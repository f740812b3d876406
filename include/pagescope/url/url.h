#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pagescope::url {

struct URL {
    std::string scheme;
    std::string username;
    std::string password;
    std::string host;
    std::optional<uint16_t> port;
    std::string path;
    std::string query;
    std::string fragment;

    std::string serialize() const;
    std::string origin() const;
    bool is_special() const;

    // Host without IPv6 brackets, lowercased.
    std::string hostname() const;

    // Explicit port, or the scheme default (0 when the scheme has none).
    uint16_t effective_port() const;

    // path + "?" + query, never empty for special schemes.
    std::string request_target() const;
};

// Parses an absolute URL, or a relative reference against base.
// Returns nullopt for malformed input.
std::optional<URL> parse(std::string_view input, const URL* base = nullptr);

// True when input starts with "scheme:" per the URL scheme grammar.
bool has_scheme(std::string_view input);

// Lowercased scheme of input, or empty when it has none.
std::string scheme_of(std::string_view input);

bool hosts_equal(std::string_view a, std::string_view b);

} // namespace pagescope::url
