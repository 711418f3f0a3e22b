#include "sthe/model/Value.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <variant>

using sthe::model::Value;

TEST(ValueTest, DefaultIsAbsentLeaf) {
    Value value;
    ASSERT_TRUE(value.isLeaf());
    EXPECT_FALSE(value.asLeaf().has_value());
}

TEST(ValueTest, MapLookupKeepsOrder) {
    auto value = Value::map({{"title", Value::leaf("T")}, {"link", Value::leaf("u")}});
    ASSERT_TRUE(value.isMap());
    EXPECT_EQ(value.asMap().front().first, "title");
    EXPECT_EQ(value.at("link"), Value::leaf("u"));
    EXPECT_EQ(value.find("missing"), nullptr);
    EXPECT_THROW(value.at("missing"), std::out_of_range);
}

TEST(ValueTest, WrongKindAccessThrows) {
    auto value = Value::list({Value::leaf("a")});
    EXPECT_THROW(value.asLeaf(), std::bad_variant_access);
    EXPECT_THROW(value.asMap(), std::bad_variant_access);
}

TEST(ValueTest, EqualityComparesStructure) {
    EXPECT_EQ(Value::list({Value::leaf("a"), Value::leaf(std::nullopt)}),
              Value::list({Value::leaf("a"), Value::leaf(std::nullopt)}));
    EXPECT_NE(Value::leaf(""), Value::leaf(std::nullopt));
    EXPECT_NE(Value::list({}), Value::map({}));
}
