#pragma once
#include <pagescope/html/tree_builder.h>
#include <pagescope/url/url.h>
#include <optional>
#include <string>
#include <string_view>

namespace pagescope::analysis {

enum class LinkClass { Internal, External, Inaccessible };

const char* link_class_name(LinkClass link_class);

// How mailto: and tel: links are counted. ftp: links are always external.
enum class SpecialSchemePolicy { Internal, External };

// Classifies anchors by syntax alone relative to the page's own URL. Never
// performs network I/O.
class LinkClassifier {
public:
    explicit LinkClassifier(const std::string& page_url,
                            SpecialSchemePolicy policy = SpecialSchemePolicy::Internal);

    LinkClass classify(std::string_view href) const;

    // The href attribute as read from the tree; nullopt means the anchor has
    // no href at all.
    LinkClass classify_attribute(const std::optional<std::string>& href) const;

    SpecialSchemePolicy policy() const { return policy_; }

private:
    std::optional<url::URL> page_;
    SpecialSchemePolicy policy_;
};

struct LinkCounts {
    int internal = 0;
    int external = 0;
    int inaccessible = 0;

    int total() const { return internal + external + inaccessible; }
    void add(LinkClass link_class);
};

bool operator==(const LinkCounts& a, const LinkCounts& b);

// Scans every <a> element once, in document order.
LinkCounts count_links(const html::Node& root, const LinkClassifier& classifier);

} // namespace pagescope::analysis
