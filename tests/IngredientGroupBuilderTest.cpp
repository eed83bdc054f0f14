#include <gtest/gtest.h>

#include "recipe/IngredientGroupBuilder.hpp"
#include "TestBlocks.hpp"

#include <string>
#include <vector>

using namespace testblocks;
using recipe::IngredientEntry;

static const recipe::Ingredient& ingredient_at(const std::vector<IngredientEntry>& entries, size_t i) {
    EXPECT_FALSE(entries.at(i).is_group());
    return entries.at(i).ingredient;
}

static const recipe::IngredientGroup& group_at(const std::vector<IngredientEntry>& entries, size_t i) {
    EXPECT_TRUE(entries.at(i).is_group());
    return entries.at(i).group;
}

TEST(IngredientGroupBuilderTest, HeadingsNestByLevel) {
    const std::vector<md::Block> blocks = {
        list({"a"}),
        heading(2, "Dough"),
        list({"b"}),
        heading(3, "Glaze"),
        list({"c"}),
        heading(2, "Filling"),
        list({"d"}),
    };

    recipe::Warnings w;
    const auto entries = recipe::build_ingredient_tree(pointers(blocks), w);

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(ingredient_at(entries, 0).name, "a");

    const auto& dough = group_at(entries, 1);
    EXPECT_EQ(dough.name, "Dough");
    EXPECT_EQ(dough.level, 2);
    ASSERT_EQ(dough.children.size(), 2u);
    EXPECT_EQ(ingredient_at(dough.children, 0).name, "b");

    const auto& glaze = group_at(dough.children, 1);
    EXPECT_EQ(glaze.name, "Glaze");
    EXPECT_EQ(glaze.level, 3);
    ASSERT_EQ(glaze.children.size(), 1u);
    EXPECT_EQ(ingredient_at(glaze.children, 0).name, "c");

    const auto& filling = group_at(entries, 2);
    EXPECT_EQ(filling.name, "Filling");
    ASSERT_EQ(filling.children.size(), 1u);
    EXPECT_EQ(ingredient_at(filling.children, 0).name, "d");

    EXPECT_TRUE(w.empty());
}

TEST(IngredientGroupBuilderTest, SkippedLevelsStillNest) {
    const std::vector<md::Block> blocks = {
        heading(2, "A"),
        heading(4, "B"),
        list({"x"}),
        heading(3, "C"),
        list({"y"}),
    };

    recipe::Warnings w;
    const auto entries = recipe::build_ingredient_tree(pointers(blocks), w);

    ASSERT_EQ(entries.size(), 1u);
    const auto& a = group_at(entries, 0);
    ASSERT_EQ(a.children.size(), 2u);
    EXPECT_EQ(group_at(a.children, 0).name, "B");
    EXPECT_EQ(group_at(a.children, 1).name, "C");
    EXPECT_EQ(ingredient_at(group_at(a.children, 1).children, 0).name, "y");
}

TEST(IngredientGroupBuilderTest, ShallowerHeadingAfterDeeperIsSibling) {
    const std::vector<md::Block> blocks = {heading(3, "Deep"), list({"x"}), heading(2, "Shallow"), list({"y"})};

    recipe::Warnings w;
    const auto entries = recipe::build_ingredient_tree(pointers(blocks), w);

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(group_at(entries, 0).name, "Deep");
    EXPECT_EQ(group_at(entries, 1).name, "Shallow");
}

TEST(IngredientGroupBuilderTest, ManySiblingGroupsKeepTheirContents) {
    std::vector<md::Block> blocks;
    for (int i = 0; i < 40; ++i) {
        blocks.push_back(heading(2, "G" + std::to_string(i)));
        blocks.push_back(heading(3, "S" + std::to_string(i)));
        blocks.push_back(list({"item" + std::to_string(i)}));
    }

    recipe::Warnings w;
    const auto entries = recipe::build_ingredient_tree(pointers(blocks), w);

    ASSERT_EQ(entries.size(), 40u);
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& sub = group_at(group_at(entries, i).children, 0);
        EXPECT_EQ(ingredient_at(sub.children, 0).name, "item" + std::to_string(i));
    }
}

TEST(IngredientGroupBuilderTest, OtherBlocksAreIgnoredWithWarning) {
    const std::vector<md::Block> blocks = {para("Some prose."), list({"flour"})};

    recipe::Warnings w;
    const auto entries = recipe::build_ingredient_tree(pointers(blocks), w);

    ASSERT_EQ(entries.size(), 1u);
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w[0].code, "unexpected_block");
}

TEST(IngredientGroupBuilderTest, EmptyItemsAreDropped) {
    const std::vector<md::Block> blocks = {item_list({{em("1 cup")}, {text("sugar")}})};

    recipe::Warnings w;
    const auto entries = recipe::build_ingredient_tree(pointers(blocks), w);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(ingredient_at(entries, 0).name, "sugar");
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w[0].code, "empty_ingredient");
}

TEST(IngredientGroupBuilderTest, WarningExcerptKeepsCodepointsWhole) {
    // 59 ASCII bytes then a two-byte "e acute" straddling the 60-byte cut
    const std::string prose = std::string(59, 'a') + "\xC3\xA9";
    const std::vector<md::Block> blocks = {para(prose), list({"flour"})};

    recipe::Warnings w;
    const auto entries = recipe::build_ingredient_tree(pointers(blocks), w);

    EXPECT_EQ(entries.size(), 1u);
    ASSERT_EQ(w.size(), 1u);
    EXPECT_NE(w[0].message.find("\"" + std::string(59, 'a') + "\""), std::string::npos);
}
