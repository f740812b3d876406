#include <pagescope/analysis/extractors.h>
#include <pagescope/analysis/login_detector.h>
#include <pagescope/html/walker.h>

#include <type_traits>

namespace pagescope::analysis {

namespace {

constexpr const char kImpliedVersion[] = "HTML5 (implied)";

bool is_heading_tag(const std::string& tag) {
    return tag.size() == 2 && tag[0] == 'h' && tag[1] >= '1' && tag[1] <= '6';
}

} // namespace

// ============================================================================
// Field extractors
// ============================================================================

std::string extract_html_version(const html::Node& root) {
    const html::Node* doctype = html::find_by_type(root, html::Node::DocumentType);
    if (!doctype || doctype->attributes.empty()) {
        return kImpliedVersion;
    }

    const std::string& raw = doctype->attributes.front().value;
    const std::string lowered = html::to_lower(raw);
    if (lowered.find("html5") != std::string::npos || lowered.find("html 5") != std::string::npos) {
        return "HTML5";
    }
    if (lowered.find("html4") != std::string::npos || lowered.find("html 4") != std::string::npos) {
        return "HTML4";
    }
    if (lowered.find("xhtml") != std::string::npos) {
        return "XHTML";
    }
    // An empty identifier carries no version information.
    return raw.empty() ? std::string(kImpliedVersion) : raw;
}

std::string extract_page_title(const html::Node& root) {
    const html::Node* title = html::find_element(root, "title");
    if (!title || title->children.empty()) {
        return "";
    }
    const html::Node& first = *title->children.front();
    if (first.type != html::Node::Text) {
        return "";
    }
    return html::trim(first.data);
}

HeadingHistogram extract_headings(const html::Node& root) {
    HeadingHistogram histogram;
    html::walk(root, [&](const html::Node& node) {
        // Tag names are lowercased by the tokenizer, so <H1> lands in "h1".
        if (node.type == html::Node::Element && is_heading_tag(node.tag_name)) {
            ++histogram[node.tag_name];
        }
        return html::WalkAction::Continue;
    });
    return histogram;
}

// ============================================================================
// Extraction passes
// ============================================================================

void apply_output(const PassOutput& output, AnalysisRecord& record) {
    std::visit([&record](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, HtmlVersion>) {
            record.html_version = value.value;
        } else if constexpr (std::is_same_v<T, PageTitle>) {
            record.page_title = value.value;
        } else if constexpr (std::is_same_v<T, HeadingHistogram>) {
            record.headings = value;
        } else if constexpr (std::is_same_v<T, LinkCounts>) {
            record.internal_links = value.internal;
            record.external_links = value.external;
            record.inaccessible_links = value.inaccessible;
        } else if constexpr (std::is_same_v<T, LoginFormFlag>) {
            record.has_login_form = value.value;
        }
    }, output);
}

bool ExtractorRegistry::add(ExtractionPass pass) {
    for (const auto& existing : passes_) {
        if (existing.name == pass.name) {
            return false;
        }
    }
    passes_.push_back(std::move(pass));
    return true;
}

ExtractorRegistry ExtractorRegistry::defaults() {
    ExtractorRegistry registry;
    registry.add({"html_version", [](const PassContext& ctx) -> core::Result<PassOutput> {
        return PassOutput{HtmlVersion{extract_html_version(ctx.document)}};
    }});
    registry.add({"page_title", [](const PassContext& ctx) -> core::Result<PassOutput> {
        return PassOutput{PageTitle{extract_page_title(ctx.document)}};
    }});
    registry.add({"headings", [](const PassContext& ctx) -> core::Result<PassOutput> {
        return PassOutput{extract_headings(ctx.document)};
    }});
    registry.add({"links", [](const PassContext& ctx) -> core::Result<PassOutput> {
        return PassOutput{count_links(ctx.document, ctx.classifier)};
    }});
    registry.add({"login_form", [](const PassContext& ctx) -> core::Result<PassOutput> {
        return PassOutput{LoginFormFlag{has_login_form(ctx.document)}};
    }});
    return registry;
}

} // namespace pagescope::analysis
