#pragma once

#include <cstddef>
#include <cstdint>

namespace pagescope::core::config {

// Worker pool sizing: one worker per default extraction pass.
inline constexpr std::size_t kDefaultWorkerCount = 5;
inline constexpr std::size_t kDefaultQueueCapacity = kDefaultWorkerCount * 2;

inline constexpr int kDefaultFetchTimeoutSeconds = 30;
inline constexpr int kDefaultMaxRedirects = 10;
inline constexpr std::size_t kMaxResponseBytes = 10 * 1024 * 1024;
inline constexpr std::size_t kMaxHeaderBytes = 1024 * 1024;

inline constexpr const char kUserAgent[] = "pagescope/1.0";
inline constexpr const char kAcceptHeader[] =
    "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
inline constexpr const char kAcceptLanguageHeader[] = "en-US,en;q=0.5";
inline constexpr const char kAcceptEncodingHeader[] = "gzip, deflate";

inline constexpr std::size_t kMaxTreeDepth = 1024;
inline constexpr std::size_t kMaxRetainedDiagnostics = 1024;

inline constexpr const char kServiceName[] = "pagescope";
inline constexpr const char kVersionString[] = "pagescope 1.0.0";

// Environment overrides read by the command-line front end.
inline constexpr const char kTimeoutEnvVar[] = "PAGESCOPE_TIMEOUT";
inline constexpr const char kWorkersEnvVar[] = "PAGESCOPE_WORKERS";

} // namespace pagescope::core::config
