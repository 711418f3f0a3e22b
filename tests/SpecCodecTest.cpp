#include "sthe/codec/SpecCodec.hpp"
#include "sthe/util/JsonUtil.hpp"

#include <gtest/gtest.h>

using sthe::codec::Format;
using sthe::codec::FormatError;
using sthe::codec::encodeSpec;
using sthe::codec::parseSpec;
using sthe::model::OptionSpec;
using sthe::model::Target;

namespace {

std::string pathOfFailure(std::string_view text, Format format = Format::json) {
    try {
        parseSpec(text, format);
    } catch (const FormatError& ex) {
        return ex.path();
    }
    ADD_FAILURE() << "expected FormatError for " << text;
    return {};
}

} // namespace

TEST(SpecCodecTest, DecodesJsonWithDefaults) {
    auto spec = parseSpec(R"({"selector": "a"})", Format::json);
    EXPECT_EQ(spec.selector, "a");
    EXPECT_EQ(spec.target, Target::text());
    EXPECT_FALSE(spec.many);
    EXPECT_TRUE(spec.trim);
    EXPECT_FALSE(spec.regex.has_value());
    EXPECT_TRUE(spec.children.empty());
}

TEST(SpecCodecTest, DecodesFieldsAndChildren) {
    auto spec = parseSpec(R"({
        "selector": "li",
        "many": true,
        "name": {"selector": "b", "trim": false},
        "link": {"selector": "a", "target": "attr:href", "regex": "id=(\\d+)"}
    })", Format::json);

    EXPECT_TRUE(spec.many);
    ASSERT_EQ(spec.children.size(), 2u);
    EXPECT_EQ(spec.children[0].first, "name");
    EXPECT_FALSE(spec.children[0].second.trim);
    EXPECT_EQ(spec.children[1].first, "link");
    EXPECT_EQ(spec.children[1].second.target, Target::attr("href"));
    EXPECT_EQ(spec.children[1].second.regex, "id=(\\d+)");
}

TEST(SpecCodecTest, TomlAndJsonDescribeTheSameSpec) {
    auto fromJson = parseSpec(R"({"selector": "div", "title": {"selector": "h1"},
                                  "link": {"selector": "a", "target": "href"}})",
                              Format::json);
    auto fromToml = parseSpec(R"(
selector = "div"

[title]
selector = "h1"

[link]
selector = "a"
target = "href"
)",
                              Format::toml);

    EXPECT_EQ(encodeSpec(fromJson), encodeSpec(fromToml));
}

TEST(SpecCodecTest, EncodeOmitsDefaults) {
    OptionSpec spec;
    spec.selector = "a";
    spec.target = Target::attr("href");
    auto encoded = encodeSpec(spec);
    EXPECT_EQ(sthe::util::stringifyJson(encoded), R"({"selector":"a","target":"attr:href"})");
}

TEST(SpecCodecTest, ReportsPathOfBadField) {
    EXPECT_EQ(pathOfFailure(R"({"target": "text"})"), "selector");
    EXPECT_EQ(pathOfFailure(R"({"selector": 1})"), "selector");
    EXPECT_EQ(pathOfFailure(R"({"selector": "a", "many": "yes"})"), "many");
    EXPECT_EQ(pathOfFailure(R"({"selector": "a", "target": ""})"), "target");
    EXPECT_EQ(pathOfFailure(R"({"selector": "a", "bogus": 3})"), "bogus");
    EXPECT_EQ(pathOfFailure(R"({"selector": "a", "child": {"selector": "b", "trim": 0}})"), "child.trim");
}

TEST(SpecCodecTest, RejectsMalformedText) {
    EXPECT_THROW(parseSpec("{\"selector\": ", Format::json), FormatError);
    EXPECT_THROW(parseSpec("[1, 2]", Format::json), FormatError);
    EXPECT_THROW(parseSpec("selector = ", Format::toml), FormatError);
}
