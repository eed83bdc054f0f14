#include <gtest/gtest.h>

#include "recipe/IngredientLineParser.hpp"
#include "TestBlocks.hpp"

using namespace testblocks;
using recipe::parse_ingredient_line;

TEST(IngredientLineParserTest, LeadingEmphasisIsTheAmount) {
    recipe::Warnings w;
    const auto ing = parse_ingredient_line({em("2 1/4 cups"), text(" all-purpose flour")}, w);

    ASSERT_TRUE(ing.has_value());
    EXPECT_EQ(ing->name, "all-purpose flour");
    ASSERT_TRUE(ing->amount.has_value());
    EXPECT_DOUBLE_EQ(*ing->amount->quantity, 2.25);
    EXPECT_EQ(ing->amount->unit, "cups");
    EXPECT_EQ(ing->amount->original_text, "2 1/4 cups");
    EXPECT_FALSE(ing->link.has_value());
}

TEST(IngredientLineParserTest, PlainNameHasNoAmount) {
    recipe::Warnings w;
    const auto ing = parse_ingredient_line({text("  salt  ")}, w);

    ASSERT_TRUE(ing.has_value());
    EXPECT_EQ(ing->name, "salt");
    EXPECT_FALSE(ing->amount.has_value());
}

TEST(IngredientLineParserTest, LinkedIngredient) {
    recipe::Warnings w;
    const auto ing = parse_ingredient_line({em("1"), text(" "), link_to("./pie-crust.md", "pie crust")}, w);

    ASSERT_TRUE(ing.has_value());
    EXPECT_EQ(ing->name, "pie crust");
    ASSERT_TRUE(ing->link.has_value());
    EXPECT_EQ(*ing->link, "./pie-crust.md");
}

TEST(IngredientLineParserTest, TwoLinksRecordNoLink) {
    recipe::Warnings w;
    const auto ing = parse_ingredient_line({link_to("a.md", "crust"), text(" or "), link_to("b.md", "dough")}, w);

    ASSERT_TRUE(ing.has_value());
    EXPECT_EQ(ing->name, "crust or dough");
    EXPECT_FALSE(ing->link.has_value());
}

TEST(IngredientLineParserTest, StrongEmphasisIsNotAnAmount) {
    recipe::Warnings w;
    const auto ing = parse_ingredient_line({em("2", 2), text(" eggs")}, w);

    ASSERT_TRUE(ing.has_value());
    EXPECT_FALSE(ing->amount.has_value());
    EXPECT_EQ(ing->name, "2 eggs");
}

TEST(IngredientLineParserTest, EmphasisLaterInLineIsPartOfName) {
    recipe::Warnings w;
    const auto ing = parse_ingredient_line({text("butter, "), em("cold")}, w);

    ASSERT_TRUE(ing.has_value());
    EXPECT_FALSE(ing->amount.has_value());
    EXPECT_EQ(ing->name, "butter, cold");
}

TEST(IngredientLineParserTest, AmountWithoutNameIsDropped) {
    recipe::Warnings w;
    const auto ing = parse_ingredient_line({em("a pinch"), text("  ")}, w);

    EXPECT_FALSE(ing.has_value());
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w[0].code, "empty_ingredient");
    EXPECT_EQ(w[0].kind, recipe::WarningKind::Content);
}

TEST(IngredientLineParserTest, BadAmountKeepsIngredientAndWarns) {
    recipe::Warnings w;
    const auto ing = parse_ingredient_line({em("1/0 cup"), text(" milk")}, w);

    ASSERT_TRUE(ing.has_value());
    ASSERT_TRUE(ing->amount.has_value());
    EXPECT_FALSE(ing->amount->quantity.has_value());
    EXPECT_EQ(ing->amount->unit, "1/0 cup");
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w[0].code, "amount_parse_failure");
}
