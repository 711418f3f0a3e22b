#include "sthe/html/Document.hpp"
#include "sthe/html/Node.hpp"

#include <gtest/gtest.h>

using sthe::html::Document;
using sthe::html::Node;

TEST(DocumentTest, FragmentHasNoImpliedWrapper) {
    auto doc = Document::parseFragment("<div><p>one</p></div>");
    EXPECT_EQ(doc.kind(), Document::Kind::fragment);

    Node root = doc.root();
    EXPECT_TRUE(root.isDocument());
    Node div = root.firstElementChild();
    ASSERT_TRUE(div);
    EXPECT_EQ(div.name(), "div");
    EXPECT_FALSE(div.nextElementSibling());

    auto bare = Document::parseFragment("just text");
    EXPECT_FALSE(bare.root().firstElementChild());
    EXPECT_EQ(bare.root().text(), "just text");

    auto trailing = Document::parseFragment("<b>x</b> tail");
    Node bold = trailing.root().firstElementChild();
    ASSERT_TRUE(bold);
    EXPECT_EQ(bold.name(), "b");
    EXPECT_FALSE(bold.nextElementSibling());
    Node tail = bold.nextSibling();
    ASSERT_TRUE(tail);
    EXPECT_FALSE(tail.isElement());
    EXPECT_EQ(tail.text(), " tail");
}

TEST(DocumentTest, FullDocumentGetsHtmlAndBody) {
    auto doc = Document::parse("<title>T</title><p>x</p>");
    Node html = doc.root().firstElementChild();
    ASSERT_TRUE(html);
    EXPECT_EQ(html.name(), "html");

    bool sawBody = false;
    for (Node child = html.firstElementChild(); child; child = child.nextElementSibling()) {
        sawBody = sawBody || child.name() == "body";
    }
    EXPECT_TRUE(sawBody);
}

TEST(DocumentTest, EmptyInputGivesEmptyTree) {
    auto doc = Document::parseFragment("");
    EXPECT_TRUE(doc.root().isDocument());
    EXPECT_FALSE(doc.root().firstElementChild());
}

TEST(DocumentTest, BrokenMarkupIsRepaired) {
    auto doc = Document::parseFragment("<div><a href=\"u\">x</div>");
    Node div = doc.root().firstElementChild();
    ASSERT_TRUE(div);
    Node link = div.firstElementChild();
    ASSERT_TRUE(link);
    EXPECT_EQ(link.name(), "a");
    EXPECT_EQ(link.attribute("href"), "u");
}

TEST(DocumentTest, NodeTextDecodesEntitiesAndConcatenates) {
    auto doc = Document::parseFragment("<p>a &amp; <b>b</b> c</p>");
    EXPECT_EQ(doc.root().firstElementChild().text(), "a & b c");
}

TEST(DocumentTest, NodeSerializesInnerAndOuterMarkup) {
    auto doc = Document::parseFragment("<div class=\"x\"><b>bold</b></div>");
    Node div = doc.root().firstElementChild();
    EXPECT_EQ(div.innerHtml(), "<b>bold</b>");
    EXPECT_EQ(div.outerHtml(), "<div class=\"x\"><b>bold</b></div>");
}

TEST(DocumentTest, AttributesAreCaseInsensitive) {
    auto doc = Document::parseFragment("<input DATA-Id=\"7\" disabled>");
    Node input = doc.root().firstElementChild();
    ASSERT_TRUE(input);
    EXPECT_EQ(input.attribute("data-id"), "7");
    EXPECT_TRUE(input.hasAttribute("disabled"));
    EXPECT_EQ(input.attribute("disabled"), "");
    EXPECT_FALSE(input.attribute("value").has_value());
}

TEST(DocumentTest, DocumentIsMovable) {
    auto doc = Document::parseFragment("<p>x</p>");
    Document moved = std::move(doc);
    EXPECT_EQ(moved.root().firstElementChild().text(), "x");
}
