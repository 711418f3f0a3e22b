#include "sthe/model/Target.hpp"

#include <gtest/gtest.h>

using sthe::model::Target;

TEST(TargetTest, ParsesNamedKinds) {
    EXPECT_EQ(Target::parse("text"), Target::text());
    EXPECT_EQ(Target::parse("html"), Target::html());
    EXPECT_EQ(Target::parse("inner_html"), Target::html());
    EXPECT_EQ(Target::parse("outer_html"), Target::outerHtml());
}

TEST(TargetTest, ParsesAttributeForms) {
    auto prefixed = Target::parse("attr:href");
    ASSERT_TRUE(prefixed.has_value());
    EXPECT_EQ(prefixed->kind(), Target::Kind::attr);
    EXPECT_EQ(prefixed->attribute(), "href");

    EXPECT_EQ(Target::parse("@src"), Target::attr("src"));
    EXPECT_EQ(Target::parse("data-id"), Target::attr("data-id"));
}

TEST(TargetTest, AttributeNamesAreLowercased) {
    EXPECT_EQ(Target::attr("HREF").attribute(), "href");
    EXPECT_EQ(Target::parse("attr:Data-Id")->describe(), "attr:data-id");
}

TEST(TargetTest, RejectsEmptyNames) {
    EXPECT_FALSE(Target::parse("").has_value());
    EXPECT_FALSE(Target::parse("attr:").has_value());
    EXPECT_FALSE(Target::parse("@").has_value());
}
