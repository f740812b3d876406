#pragma once
#include <string>
#include <string_view>

namespace pagescope::net {

// Standard reason phrase for an HTTP status code, or "" when unknown.
const char* reason_phrase(int status_code);

inline bool is_redirect_status(int status_code) {
    return status_code == 301 || status_code == 302 || status_code == 303 ||
           status_code == 307 || status_code == 308;
}

// User-facing explanation of a non-200 response. Codes without a dedicated
// explanation render as "HTTP {code}: {reason}", where an empty reason falls
// back to the standard phrase.
std::string describe_status(int status_code, std::string_view reason = {});

} // namespace pagescope::net
