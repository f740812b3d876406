#include <pagescope/analysis/extractors.h>
#include <pagescope/html/tree_builder.h>

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace pagescope::analysis;
namespace html = pagescope::html;
using pagescope::core::AnalysisError;
using pagescope::core::Result;

namespace {

std::unique_ptr<html::Node> parse_doc(std::string_view markup) {
    auto result = html::parse(markup);
    if (!result.ok()) return nullptr;
    return std::move(result).value();
}

std::string version_of(std::string_view markup) {
    auto doc = parse_doc(markup);
    return doc ? extract_html_version(*doc) : "<parse failed>";
}

} // namespace

// ============================================================================
// HTML version
// ============================================================================

// 1. Bare doctype and missing doctype are implied HTML5
TEST(ExtractorsTest, ImpliedHtml5) {
    EXPECT_EQ(version_of("<!DOCTYPE html><title>x</title>"), "HTML5 (implied)");
    EXPECT_EQ(version_of("<title>x</title>"), "HTML5 (implied)");
    EXPECT_EQ(version_of("<!DOCTYPE html PUBLIC \"\">"), "HTML5 (implied)");
}

// 2. Public identifiers map to version families
TEST(ExtractorsTest, KnownFamilies) {
    EXPECT_EQ(version_of("<!DOCTYPE HTML PUBLIC \"-//W3C//DTD HTML 4.01//EN\" "
                         "\"http://www.w3.org/TR/html4/strict.dtd\">"),
              "HTML4");
    EXPECT_EQ(version_of("<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Strict//EN\" "
                         "\"http://www.w3.org/TR/xhtml1/DTD/xhtml1-strict.dtd\">"),
              "XHTML");
    EXPECT_EQ(version_of("<!DOCTYPE html PUBLIC \"-//custom//HTML5 draft//EN\">"), "HTML5");
}

// 3. Unknown identifiers are reported verbatim
TEST(ExtractorsTest, UnknownIdentifierVerbatim) {
    EXPECT_EQ(version_of("<!DOCTYPE html SYSTEM \"about:legacy-compat\">"), "about:legacy-compat");
    EXPECT_EQ(version_of("<!DOCTYPE html PUBLIC \"-//IETF//DTD HTML 2.0//EN\">"),
              "-//IETF//DTD HTML 2.0//EN");
}

// ============================================================================
// Title
// ============================================================================

// 4. First title, trimmed
TEST(ExtractorsTest, PageTitle) {
    auto doc = parse_doc("<title>\n  Example Domain  \n</title><title>Second</title>");
    ASSERT_NE(doc, nullptr);
    EXPECT_EQ(extract_page_title(*doc), "Example Domain");
}

// 5. Missing or empty title
TEST(ExtractorsTest, MissingOrEmptyTitle) {
    auto none = parse_doc("<p>no title</p>");
    ASSERT_NE(none, nullptr);
    EXPECT_EQ(extract_page_title(*none), "");

    auto empty = parse_doc("<title></title>");
    ASSERT_NE(empty, nullptr);
    EXPECT_EQ(extract_page_title(*empty), "");

    auto blank = parse_doc("<title>   </title>");
    ASSERT_NE(blank, nullptr);
    EXPECT_EQ(extract_page_title(*blank), "");
}

// ============================================================================
// Headings
// ============================================================================

// 6. Counts are case-insensitive and omit absent levels
TEST(ExtractorsTest, HeadingHistogram) {
    auto doc = parse_doc("<H1>a</H1><h2>b</h2><div><h2>c</h2></div><h6>d</h6><header>e</header>");
    ASSERT_NE(doc, nullptr);
    HeadingHistogram expected = {{"h1", 1}, {"h2", 2}, {"h6", 1}};
    EXPECT_EQ(extract_headings(*doc), expected);
}

// 7. No headings yields an empty histogram
TEST(ExtractorsTest, NoHeadings) {
    auto doc = parse_doc("<p>plain</p><hr><h7>not a heading</h7>");
    ASSERT_NE(doc, nullptr);
    EXPECT_TRUE(extract_headings(*doc).empty());
}

// ============================================================================
// Passes and registry
// ============================================================================

// 8. Default registry holds the five passes in order
TEST(ExtractorsTest, DefaultRegistry) {
    auto registry = ExtractorRegistry::defaults();
    ASSERT_EQ(registry.size(), 5u);
    EXPECT_EQ(registry.passes()[0].name, "html_version");
    EXPECT_EQ(registry.passes()[1].name, "page_title");
    EXPECT_EQ(registry.passes()[2].name, "headings");
    EXPECT_EQ(registry.passes()[3].name, "links");
    EXPECT_EQ(registry.passes()[4].name, "login_form");
}

// 9. Duplicate pass names are rejected
TEST(ExtractorsTest, DuplicatePassRejected) {
    auto registry = ExtractorRegistry::defaults();
    EXPECT_FALSE(registry.add({"links", [](const PassContext&) -> Result<PassOutput> {
        return PassOutput{LinkCounts{}};
    }}));
    EXPECT_TRUE(registry.add({"word_count", [](const PassContext&) -> Result<PassOutput> {
        return AnalysisError{500, "not implemented", ""};
    }}));
    EXPECT_EQ(registry.size(), 6u);
}

// 10. Running every default pass fills the record
TEST(ExtractorsTest, DefaultPassesFillRecord) {
    auto doc = parse_doc(
        "<!DOCTYPE html><title>Login</title><h1>Hi</h1>"
        "<a href=\"/a\">a</a><a href=\"https://other.com\">b</a><a>c</a>"
        "<form action=\"/login\"><input type=\"password\"></form>");
    ASSERT_NE(doc, nullptr);
    LinkClassifier classifier("https://example.com/");
    PassContext ctx{*doc, classifier};

    AnalysisRecord record;
    for (const auto& pass : ExtractorRegistry::defaults().passes()) {
        auto output = pass.run(ctx);
        ASSERT_TRUE(output.ok()) << pass.name;
        apply_output(output.value(), record);
    }

    EXPECT_EQ(record.html_version, "HTML5 (implied)");
    EXPECT_EQ(record.page_title, "Login");
    EXPECT_EQ(record.headings, (HeadingHistogram{{"h1", 1}}));
    EXPECT_EQ(record.internal_links, 1);
    EXPECT_EQ(record.external_links, 1);
    EXPECT_EQ(record.inaccessible_links, 1);
    EXPECT_TRUE(record.has_login_form);
}

// 11. apply_output touches only the field it owns
TEST(ExtractorsTest, ApplyOutputTouchesOneField) {
    AnalysisRecord record;
    record.page_title = "kept";
    apply_output(PassOutput{LinkCounts{4, 5, 6}}, record);
    EXPECT_EQ(record.page_title, "kept");
    EXPECT_EQ(record.internal_links, 4);
    EXPECT_EQ(record.external_links, 5);
    EXPECT_EQ(record.inaccessible_links, 6);

    apply_output(PassOutput{LoginFormFlag{true}}, record);
    EXPECT_TRUE(record.has_login_form);
    EXPECT_EQ(record.internal_links, 4);
}
