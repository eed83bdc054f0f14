#include <gtest/gtest.h>

#include "recipe/TextUtil.hpp"

#include <string>
#include <vector>

using Strings = std::vector<std::string>;

TEST(TextUtilTest, TrimStripsAsciiWhitespace) {
    EXPECT_EQ(textutil::trim("  flour \t\n"), "flour");
    EXPECT_EQ(textutil::trim("   "), "");
    EXPECT_EQ(textutil::trim(""), "");
}

TEST(TextUtilTest, SplitCommasOnPlainList) {
    EXPECT_EQ(textutil::split_commas("vegan, quick,dessert"), (Strings{"vegan", "quick", "dessert"}));
}

TEST(TextUtilTest, SplitCommasKeepsDecimalComma) {
    EXPECT_EQ(textutil::split_commas("1,5 kg, 4 servings"), (Strings{"1,5 kg", "4 servings"}));
}

TEST(TextUtilTest, SplitCommasNeedsDigitsOnBothSides) {
    EXPECT_EQ(textutil::split_commas("1, 5"), (Strings{"1", "5"}));
    EXPECT_EQ(textutil::split_commas("a,5"), (Strings{"a", "5"}));
    EXPECT_EQ(textutil::split_commas("5,a"), (Strings{"5", "a"}));
}

TEST(TextUtilTest, SplitCommasDropsEmptySegments) {
    EXPECT_EQ(textutil::split_commas(" , a,, b , "), (Strings{"a", "b"}));
    EXPECT_TRUE(textutil::split_commas("").empty());
    EXPECT_TRUE(textutil::split_commas(",,,").empty());
}

TEST(TextUtilTest, SplitCommasHandlesMultibyteNeighbours) {
    // "½,1" : the comma follows a two-byte glyph, not a digit
    EXPECT_EQ(textutil::split_commas("\xC2\xBD,1"), (Strings{"\xC2\xBD", "1"}));
}

TEST(TextUtilTest, NextCodepointDecodesUtf8) {
    const std::string s = "a\xC2\xBD\xE2\x85\x9B";
    size_t i = 0;
    EXPECT_EQ(textutil::next_codepoint(s, i), U'a');
    EXPECT_EQ(textutil::next_codepoint(s, i), U'\u00BD');
    EXPECT_EQ(textutil::next_codepoint(s, i), U'\u215B');
    EXPECT_EQ(i, s.size());
}

TEST(TextUtilTest, NextCodepointReplacesInvalidBytes) {
    const std::string s = "\xFF" "a";
    size_t i = 0;
    EXPECT_EQ(textutil::next_codepoint(s, i), static_cast<char32_t>(0xFFFD));
    EXPECT_EQ(i, 1u);
}

TEST(TextUtilTest, TruncateUtf8StopsOnCodepointBoundary) {
    const std::string s = "\xC3\xA9\xC3\xA9\xC3\xA9";
    EXPECT_EQ(textutil::truncate_utf8(s, 3), "\xC3\xA9");
    EXPECT_EQ(textutil::truncate_utf8(s, 4), "\xC3\xA9\xC3\xA9");
    EXPECT_EQ(textutil::truncate_utf8(s, 1), "");
    EXPECT_EQ(textutil::truncate_utf8("abc", 10), "abc");
}
