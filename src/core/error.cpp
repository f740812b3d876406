#include <pagescope/core/error.h>

namespace pagescope::core {

std::string AnalysisError::describe() const {
    return "HTTP " + std::to_string(status_code) + ": " + error_message +
           " (URL: " + url + ")";
}

} // namespace pagescope::core
