#include <gtest/gtest.h>

#include "recipe/SectionSegmenter.hpp"
#include "TestBlocks.hpp"

#include <vector>

using namespace testblocks;
using recipe::ParseMode;
using recipe::StructureError;

TEST(SectionSegmenterTest, SplitsOnFirstTwoDividers) {
    const std::vector<md::Block> blocks = {
        heading(1, "Pie"), para("desc"), hr(),
        list({"flour"}), hr(),
        para("step one"), hr(), para("step two"),
    };

    recipe::Warnings w;
    const recipe::Sections s = recipe::segment_sections(blocks, ParseMode::Strict, w);

    EXPECT_EQ(s.divider_count, 3);
    ASSERT_EQ(s.metadata.size(), 2u);
    ASSERT_EQ(s.ingredients.size(), 1u);
    EXPECT_EQ(s.ingredients[0]->kind, md::BlockKind::List);

    // the third divider is instruction content
    ASSERT_EQ(s.instructions.size(), 3u);
    EXPECT_EQ(s.instructions[1]->kind, md::BlockKind::ThematicBreak);
    EXPECT_TRUE(w.empty());
}

TEST(SectionSegmenterTest, SingleDividerLeavesNoInstructions) {
    const std::vector<md::Block> blocks = {heading(1, "Pie"), hr(), list({"a", "b"})};

    recipe::Warnings w;
    const recipe::Sections s = recipe::segment_sections(blocks, ParseMode::Strict, w);

    EXPECT_EQ(s.divider_count, 1);
    EXPECT_EQ(s.metadata.size(), 1u);
    EXPECT_EQ(s.ingredients.size(), 1u);
    EXPECT_TRUE(s.instructions.empty());
}

TEST(SectionSegmenterTest, MissingDividerThrowsInStrictMode) {
    const std::vector<md::Block> blocks = {heading(1, "Pie"), para("just text")};

    recipe::Warnings w;
    try {
        recipe::segment_sections(blocks, ParseMode::Strict, w);
        FAIL() << "expected StructureError";
    } catch (const StructureError& e) {
        EXPECT_EQ(e.code(), StructureError::Code::MissingDivider);
    }
}

TEST(SectionSegmenterTest, EmptyDocumentThrowsInStrictMode) {
    const std::vector<md::Block> blocks;
    recipe::Warnings w;
    EXPECT_THROW(recipe::segment_sections(blocks, ParseMode::Strict, w), StructureError);
}

TEST(SectionSegmenterTest, MissingDividerIsAWarningInPermissiveMode) {
    const std::vector<md::Block> blocks = {heading(1, "Pie"), para("just text")};

    recipe::Warnings w;
    const recipe::Sections s = recipe::segment_sections(blocks, ParseMode::Permissive, w);

    EXPECT_EQ(s.metadata.size(), 2u);
    EXPECT_TRUE(s.ingredients.empty());
    EXPECT_TRUE(s.instructions.empty());
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w[0].code, "missing_divider");
    EXPECT_EQ(w[0].kind, recipe::WarningKind::Structure);
}

TEST(SectionSegmenterTest, PointersReferToInputBlocks) {
    const std::vector<md::Block> blocks = {heading(1, "Pie"), hr(), list({"a"})};

    recipe::Warnings w;
    const recipe::Sections s = recipe::segment_sections(blocks, ParseMode::Strict, w);

    EXPECT_EQ(s.metadata[0], &blocks[0]);
    EXPECT_EQ(s.ingredients[0], &blocks[2]);
}
