#include <pagescope/analysis/link_classifier.h>
#include <pagescope/html/walker.h>

namespace pagescope::analysis {

namespace {

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

} // namespace

const char* link_class_name(LinkClass link_class) {
    switch (link_class) {
        case LinkClass::Internal: return "internal";
        case LinkClass::External: return "external";
        case LinkClass::Inaccessible: return "inaccessible";
    }
    return "unknown";
}

LinkClassifier::LinkClassifier(const std::string& page_url, SpecialSchemePolicy policy)
    : page_(url::parse(page_url)), policy_(policy) {}

LinkClass LinkClassifier::classify_attribute(const std::optional<std::string>& href) const {
    if (!href) {
        return LinkClass::Inaccessible;
    }
    return classify(std::string_view(*href));
}

LinkClass LinkClassifier::classify(std::string_view href) const {
    const std::string value = html::trim(href);
    if (value.empty()) {
        return LinkClass::Inaccessible;
    }

    const std::string lowered = html::to_lower(value);
    if (starts_with(lowered, "javascript:")) {
        return LinkClass::Inaccessible;
    }

    const bool protocol_relative = starts_with(value, "//");
    if (!protocol_relative && !url::has_scheme(value)) {
        // Paths, fragments and query-only references stay on this page's site.
        return LinkClass::Internal;
    }

    if (!protocol_relative) {
        const std::string scheme = url::scheme_of(value);
        if (scheme == "mailto" || scheme == "tel") {
            return policy_ == SpecialSchemePolicy::Internal ? LinkClass::Internal
                                                            : LinkClass::External;
        }
        if (scheme == "ftp") {
            return LinkClass::External;
        }
    }

    std::string absolute = value;
    if (protocol_relative) {
        absolute = (page_ ? page_->scheme : std::string("http")) + ":" + value;
    }

    auto target = url::parse(absolute);
    if (!target) {
        return LinkClass::Inaccessible;
    }
    if (!page_) {
        return LinkClass::External;
    }

    const std::string host = target->hostname();
    if (!host.empty() && url::hosts_equal(host, page_->hostname())) {
        return LinkClass::Internal;
    }
    return LinkClass::External;
}

void LinkCounts::add(LinkClass link_class) {
    switch (link_class) {
        case LinkClass::Internal: ++internal; break;
        case LinkClass::External: ++external; break;
        case LinkClass::Inaccessible: ++inaccessible; break;
    }
}

bool operator==(const LinkCounts& a, const LinkCounts& b) {
    return a.internal == b.internal && a.external == b.external &&
           a.inaccessible == b.inaccessible;
}

LinkCounts count_links(const html::Node& root, const LinkClassifier& classifier) {
    LinkCounts counts;
    html::walk(root, [&](const html::Node& node) {
        if (node.is_element("a")) {
            counts.add(classifier.classify_attribute(html::get_attribute(node, "href")));
        }
        return html::WalkAction::Continue;
    });
    return counts;
}

} // namespace pagescope::analysis
