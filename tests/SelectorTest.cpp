#include "sthe/html/Document.hpp"
#include "sthe/html/Selector.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using sthe::html::Document;
using sthe::html::Selector;
using sthe::html::SelectorError;

namespace {

constexpr const char* kList =
    "<div id=\"main\">"
    "<h2>Items</h2>"
    "<ul id=\"list\">"
    "<li class=\"a first\">1</li>"
    "<li class=\"b\">2</li>"
    "<li class=\"a\" data-kind=\"Special\">3</li>"
    "<li lang=\"en-US\">4</li>"
    "</ul>"
    "<p></p>"
    "<p>tail <a href=\"https://example.com/page.html\">link</a></p>"
    "</div>";

std::vector<std::string> texts(std::string_view selector, std::string_view html = kList) {
    auto doc = Document::parseFragment(html);
    std::vector<std::string> out;
    for (const auto& node : Selector::parse(selector).select(doc.root())) {
        out.push_back(node.text());
    }
    return out;
}

using Texts = std::vector<std::string>;

} // namespace

TEST(SelectorTest, MatchesTypeClassAndId) {
    EXPECT_EQ(texts("li"), (Texts{"1", "2", "3", "4"}));
    EXPECT_EQ(texts(".a"), (Texts{"1", "3"}));
    EXPECT_EQ(texts("li.a.first"), (Texts{"1"}));
    EXPECT_EQ(texts("#list > li.b"), (Texts{"2"}));
    EXPECT_EQ(texts("LI.b"), (Texts{"2"}));
}

TEST(SelectorTest, ResultsFollowDocumentOrderAcrossAlternatives) {
    EXPECT_EQ(texts("li.b, h2, li.first"), (Texts{"Items", "1", "2"}));
}

TEST(SelectorTest, Combinators) {
    EXPECT_EQ(texts("div li.first"), (Texts{"1"}));
    EXPECT_EQ(texts("div > li"), Texts{});
    EXPECT_EQ(texts("li.first + li"), (Texts{"2"}));
    EXPECT_EQ(texts("li.b ~ li"), (Texts{"3", "4"}));
    EXPECT_EQ(texts("h2 ~ p > a"), (Texts{"link"}));
}

TEST(SelectorTest, AttributeOperators) {
    EXPECT_EQ(texts("[data-kind]"), (Texts{"3"}));
    EXPECT_EQ(texts("[data-kind=Special]"), (Texts{"3"}));
    EXPECT_EQ(texts("[data-kind=special]"), Texts{});
    EXPECT_EQ(texts("[data-kind=special i]"), (Texts{"3"}));
    EXPECT_EQ(texts("[class~=first]"), (Texts{"1"}));
    EXPECT_EQ(texts("[lang|=en]"), (Texts{"4"}));
    EXPECT_EQ(texts("a[href^=\"https://\"]"), (Texts{"link"}));
    EXPECT_EQ(texts("a[href$='.html']"), (Texts{"link"}));
    EXPECT_EQ(texts("a[href*=example]"), (Texts{"link"}));
    EXPECT_EQ(texts("a[href^=\"\"]"), Texts{});
}

TEST(SelectorTest, StructuralPseudoClasses) {
    EXPECT_EQ(texts("li:first-child"), (Texts{"1"}));
    EXPECT_EQ(texts("li:last-child"), (Texts{"4"}));
    EXPECT_EQ(texts("li:nth-child(2n)"), (Texts{"2", "4"}));
    EXPECT_EQ(texts("li:nth-child(odd)"), (Texts{"1", "3"}));
    EXPECT_EQ(texts("li:nth-child(-n+2)"), (Texts{"1", "2"}));
    EXPECT_EQ(texts("li:nth-last-child(1)"), (Texts{"4"}));
    EXPECT_EQ(texts("p:first-of-type"), (Texts{""}));
    EXPECT_EQ(texts("p:last-of-type > a:only-child"), (Texts{"link"}));
    EXPECT_EQ(texts("p:empty"), (Texts{""}));
    EXPECT_EQ(texts(":root > h2"), (Texts{"Items"}));
}

TEST(SelectorTest, LogicalPseudoClasses) {
    EXPECT_EQ(texts("li:not(.a)"), (Texts{"2", "4"}));
    EXPECT_EQ(texts("li:not(.a, [lang])"), (Texts{"2"}));
    EXPECT_EQ(texts(":is(h2, a)"), (Texts{"Items", "link"}));
    EXPECT_EQ(texts("li:where(.b)"), (Texts{"2"}));
}

TEST(SelectorTest, EscapedIdentifiers) {
    EXPECT_EQ(texts("#a\\:b", "<p id=\"a:b\">x</p>"), (Texts{"x"}));
    EXPECT_EQ(texts(".\\31 st", "<p class=\"1st\">y</p>"), (Texts{"y"}));
}

TEST(SelectorTest, SelectFirstReturnsEarliestMatch) {
    auto doc = Document::parseFragment(kList);
    auto first = Selector::parse("li.a").selectFirst(doc.root());
    ASSERT_TRUE(first);
    EXPECT_EQ(first.text(), "1");
    EXPECT_FALSE(Selector::parse("table").selectFirst(doc.root()));
}

TEST(SelectorTest, ScopeIsNotPartOfTheResult) {
    auto doc = Document::parseFragment(kList);
    auto list = Selector::parse("#list").selectFirst(doc.root());
    ASSERT_TRUE(list);
    EXPECT_TRUE(Selector::parse("ul").select(list).empty());
    EXPECT_EQ(Selector::parse("div li").select(list).size(), 4u);
}

TEST(SelectorTest, RejectsInvalidSyntax) {
    EXPECT_THROW(Selector::parse(""), SelectorError);
    EXPECT_THROW(Selector::parse("li >"), SelectorError);
    EXPECT_THROW(Selector::parse("[href"), SelectorError);
    EXPECT_THROW(Selector::parse("p::before"), SelectorError);
    EXPECT_THROW(Selector::parse("a:hover"), SelectorError);
    EXPECT_THROW(Selector::parse("svg|rect"), SelectorError);
    EXPECT_THROW(Selector::parse("li:nth-child(x)"), SelectorError);
}

TEST(SelectorTest, NthOffsetsAtIntegerLimits) {
    EXPECT_EQ(texts("li:nth-child(n-2147483647)"), (Texts{"1", "2", "3", "4"}));
    EXPECT_EQ(texts("li:nth-child(-n+2147483647)"), (Texts{"1", "2", "3", "4"}));
}

TEST(SelectorTest, DescendantBacktrackingFindsLaterAncestor) {
    const char* html = "<div class=\"a\"><div class=\"b\"><div class=\"b\"><div class=\"c\">z</div></div></div></div>";
    EXPECT_EQ(texts(".a > .b .c", html), (Texts{"z"}));
    EXPECT_EQ(texts(".a > .b > .b + .c", html), Texts{});
}

TEST(SelectorTest, FailedDescendantChainStopsEarly) {
    std::string html;
    for (int i = 0; i < 120; ++i) {
        html += "<div>";
    }
    html += "<span>deep</span>";
    for (int i = 0; i < 120; ++i) {
        html += "</div>";
    }

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(texts("section div div div div div span", html), Texts{});
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(texts("div div div div div span", html), (Texts{"deep"}));
}

TEST(SelectorTest, RejectsDeeplyNestedPseudoClasses) {
    std::string selector = "a";
    for (int i = 0; i < 40; ++i) {
        selector += ":not(";
    }
    EXPECT_THROW(Selector::parse(selector), SelectorError);

    std::string nested = "a";
    for (int i = 0; i < 8; ++i) {
        nested += ":not(b";
    }
    nested += std::string(8, ')');
    EXPECT_NO_THROW(Selector::parse(nested));
}
