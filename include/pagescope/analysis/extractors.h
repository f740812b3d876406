#pragma once
#include <pagescope/analysis/link_classifier.h>
#include <pagescope/analysis/record.h>
#include <pagescope/core/error.h>
#include <pagescope/html/tree_builder.h>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace pagescope::analysis {

// ============================================================================
// Field extractors
// ============================================================================

// "HTML5 (implied)", "HTML5", "HTML4", "XHTML", or the raw public identifier.
std::string extract_html_version(const html::Node& root);

// Trimmed text of the first <title>, or empty.
std::string extract_page_title(const html::Node& root);

HeadingHistogram extract_headings(const html::Node& root);

// ============================================================================
// Extraction passes
// ============================================================================

// Distinct wrapper types keep every pass's output in its own variant slot.
struct HtmlVersion {
    std::string value;
};

struct PageTitle {
    std::string value;
};

struct LoginFormFlag {
    bool value = false;
};

using PassOutput = std::variant<HtmlVersion, PageTitle, HeadingHistogram, LinkCounts, LoginFormFlag>;

// Everything a pass may read. The tree is shared read-only between passes.
struct PassContext {
    const html::Node& document;
    const LinkClassifier& classifier;
};

struct ExtractionPass {
    std::string name;
    std::function<core::Result<PassOutput>(const PassContext&)> run;
};

// Copies one pass output into the record field it owns.
void apply_output(const PassOutput& output, AnalysisRecord& record);

// Ordered set of passes; the service runs one task per registered pass.
class ExtractorRegistry {
public:
    // Returns false when a pass with the same name is already registered.
    bool add(ExtractionPass pass);

    const std::vector<ExtractionPass>& passes() const { return passes_; }
    size_t size() const { return passes_.size(); }

    // html_version, page_title, headings, links, login_form.
    static ExtractorRegistry defaults();

private:
    std::vector<ExtractionPass> passes_;
};

} // namespace pagescope::analysis
