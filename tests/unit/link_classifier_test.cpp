#include <pagescope/analysis/link_classifier.h>
#include <pagescope/html/tree_builder.h>
#include <pagescope/html/walker.h>

#include <gtest/gtest.h>

#include <optional>
#include <string>

using namespace pagescope::analysis;
namespace html = pagescope::html;

// ---------------------------------------------------------------------------
// 1. Missing and empty hrefs are inaccessible
// ---------------------------------------------------------------------------
TEST(LinkClassifierTest, MissingOrEmptyHrefInaccessible) {
    LinkClassifier classifier("https://example.com/");
    EXPECT_EQ(classifier.classify_attribute(std::nullopt), LinkClass::Inaccessible);
    EXPECT_EQ(classifier.classify_attribute(std::string("")), LinkClass::Inaccessible);
    EXPECT_EQ(classifier.classify_attribute(std::string("/about")), LinkClass::Internal);
    EXPECT_EQ(classifier.classify(""), LinkClass::Inaccessible);
    EXPECT_EQ(classifier.classify("   "), LinkClass::Inaccessible);
    EXPECT_EQ(classifier.classify("\t\n"), LinkClass::Inaccessible);

    const std::string href = " ";
    EXPECT_EQ(classifier.classify(href), LinkClass::Inaccessible);
}

// ---------------------------------------------------------------------------
// 2. javascript: in any letter case is inaccessible
// ---------------------------------------------------------------------------
TEST(LinkClassifierTest, JavascriptInaccessible) {
    LinkClassifier classifier("https://example.com/");
    for (const char* href : {"javascript:void(0)", "JavaScript:alert(1)", "JAVASCRIPT:",
                             "  javascript:go()"}) {
        EXPECT_EQ(classifier.classify(href), LinkClass::Inaccessible) << href;
    }
}

// ---------------------------------------------------------------------------
// 3. Relative references are internal
// ---------------------------------------------------------------------------
TEST(LinkClassifierTest, RelativeInternal) {
    LinkClassifier classifier("https://example.com/docs/");
    for (const char* href : {"/about", "about.html", "../up", "#section", "?page=2",
                             "./", "path/with:colon", "page"}) {
        EXPECT_EQ(classifier.classify(href), LinkClass::Internal) << href;
    }
}

// ---------------------------------------------------------------------------
// 4. Absolute hrefs compare full hostnames, ignoring case
// ---------------------------------------------------------------------------
TEST(LinkClassifierTest, AbsoluteHostComparison) {
    LinkClassifier classifier("https://example.com/");
    EXPECT_EQ(classifier.classify("https://example.com/contact"), LinkClass::Internal);
    EXPECT_EQ(classifier.classify("http://EXAMPLE.com"), LinkClass::Internal);
    EXPECT_EQ(classifier.classify("https://example.com:8443/x"), LinkClass::Internal);
    EXPECT_EQ(classifier.classify("https://other.com"), LinkClass::External);
    EXPECT_EQ(classifier.classify("https://www.example.com/"), LinkClass::External);
    EXPECT_EQ(classifier.classify("https://example.com.evil.net/"), LinkClass::External);
}

// ---------------------------------------------------------------------------
// 5. Protocol-relative hrefs borrow the page scheme
// ---------------------------------------------------------------------------
TEST(LinkClassifierTest, ProtocolRelative) {
    LinkClassifier classifier("https://example.com/");
    EXPECT_EQ(classifier.classify("//example.com/lib.js"), LinkClass::Internal);
    EXPECT_EQ(classifier.classify("//cdn.other.net/lib.js"), LinkClass::External);
}

// ---------------------------------------------------------------------------
// 6. mailto: and tel: follow the configured policy; ftp: is external
// ---------------------------------------------------------------------------
TEST(LinkClassifierTest, SpecialSchemePolicy) {
    LinkClassifier internal_policy("https://example.com/");
    EXPECT_EQ(internal_policy.policy(), SpecialSchemePolicy::Internal);
    EXPECT_EQ(internal_policy.classify("mailto:team@example.com"), LinkClass::Internal);
    EXPECT_EQ(internal_policy.classify("TEL:+15551234"), LinkClass::Internal);
    EXPECT_EQ(internal_policy.classify("ftp://example.com/file"), LinkClass::External);

    LinkClassifier external_policy("https://example.com/", SpecialSchemePolicy::External);
    EXPECT_EQ(external_policy.classify("mailto:team@example.com"), LinkClass::External);
    EXPECT_EQ(external_policy.classify("tel:+15551234"), LinkClass::External);
    EXPECT_EQ(external_policy.classify("ftp://example.com/file"), LinkClass::External);
}

// ---------------------------------------------------------------------------
// 7. Malformed absolute hrefs are inaccessible, not external
// ---------------------------------------------------------------------------
TEST(LinkClassifierTest, MalformedInaccessible) {
    LinkClassifier classifier("https://example.com/");
    EXPECT_EQ(classifier.classify("http://exa mple.com/"), LinkClass::Inaccessible);
    EXPECT_EQ(classifier.classify("https://"), LinkClass::Inaccessible);
    EXPECT_EQ(classifier.classify("http://example.com:99999/"), LinkClass::Inaccessible);
}

// ---------------------------------------------------------------------------
// 8. Other schemes without a host are external
// ---------------------------------------------------------------------------
TEST(LinkClassifierTest, HostlessSchemesExternal) {
    LinkClassifier classifier("https://example.com/");
    EXPECT_EQ(classifier.classify("data:text/plain,hi"), LinkClass::External);
    EXPECT_EQ(classifier.classify("sms:+15551234"), LinkClass::External);
}

// ---------------------------------------------------------------------------
// 9. Unparsable page URL makes absolute links external
// ---------------------------------------------------------------------------
TEST(LinkClassifierTest, UnparsablePageUrl) {
    LinkClassifier classifier("not a url");
    EXPECT_EQ(classifier.classify("/about"), LinkClass::Internal);
    EXPECT_EQ(classifier.classify("https://example.com/"), LinkClass::External);
    EXPECT_EQ(classifier.classify("//example.com/"), LinkClass::External);
    EXPECT_EQ(classifier.classify(""), LinkClass::Inaccessible);
}

// ---------------------------------------------------------------------------
// 10. Counts cover every anchor exactly once
// ---------------------------------------------------------------------------
TEST(LinkClassifierTest, CountLinksSumsToAnchorCount) {
    auto parsed = html::parse(
        "<a href=\"/about\">a</a>"
        "<a href=\"https://other.com\">b</a>"
        "<a>no href</a>"
        "<a href=\"\">empty</a>"
        "<a href=\"javascript:void(0)\">js</a>"
        "<div><a href=\"HTTPS://Example.com/deep\">c</a></div>"
        "<a href=\"mailto:x@example.com\">mail</a>");
    ASSERT_TRUE(parsed.ok());
    const auto& doc = *parsed.value();

    LinkClassifier classifier("https://example.com/");
    LinkCounts counts = count_links(doc, classifier);
    EXPECT_EQ(counts.internal, 3);
    EXPECT_EQ(counts.external, 1);
    EXPECT_EQ(counts.inaccessible, 3);
    EXPECT_EQ(counts.total(), static_cast<int>(html::find_all_elements(doc, "a").size()));
}

// ---------------------------------------------------------------------------
// 11. Names and counter arithmetic
// ---------------------------------------------------------------------------
TEST(LinkClassifierTest, CountsAndNames) {
    LinkCounts counts;
    counts.add(LinkClass::Internal);
    counts.add(LinkClass::Internal);
    counts.add(LinkClass::Inaccessible);
    EXPECT_EQ(counts, (LinkCounts{2, 0, 1}));
    EXPECT_EQ(counts.total(), 3);

    EXPECT_STREQ(link_class_name(LinkClass::Internal), "internal");
    EXPECT_STREQ(link_class_name(LinkClass::External), "external");
    EXPECT_STREQ(link_class_name(LinkClass::Inaccessible), "inaccessible");
}
