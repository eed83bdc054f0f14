#include <gtest/gtest.h>

#include "io/JsonIO.hpp"
#include "recipe/AmountParser.hpp"
#include "recipe/MarkdownRenderer.hpp"
#include "recipe/RecipeParser.hpp"
#include "RecipeFixtures.hpp"

#include <string>

static recipe::Recipe reparse(const recipe::Recipe& r) {
    return recipe::parse_recipe_markdown(recipe::render_markdown(r)).recipe;
}

TEST(MarkdownRendererTest, CanonicalSourceIsReproducedExactly) {
    const recipe::Recipe r = recipe::parse_recipe_markdown(fixtures::apple_pie()).recipe;
    EXPECT_EQ(recipe::render_markdown(r), fixtures::apple_pie());
}

TEST(MarkdownRendererTest, ParseRenderParseIsStable) {
    const recipe::Recipe a = recipe::parse_recipe_markdown(fixtures::apple_pie()).recipe;
    const recipe::Recipe b = reparse(a);

    EXPECT_EQ(recipe::recipe_to_json(a), recipe::recipe_to_json(b));
    EXPECT_EQ(a.description, b.description);
    EXPECT_EQ(a.instructions, b.instructions);
}

TEST(MarkdownRendererTest, MinimalRecipeKeepsBothDividers) {
    recipe::Recipe r;
    r.title = "Water";

    const std::string md = recipe::render_markdown(r);
    EXPECT_EQ(md, "# Water\n\n---\n\n---\n");

    const recipe::ParseResult res = recipe::parse_recipe_markdown(md);
    EXPECT_EQ(res.recipe.title, "Water");
    EXPECT_TRUE(res.warnings.empty());
}

TEST(MarkdownRendererTest, MarkupCharactersInTextAreEscaped) {
    recipe::Recipe r;
    r.title = "Pie *deluxe*";
    r.tags = {"x_y"};

    recipe::Ingredient starred;
    starred.name = "a*b";
    starred.amount = recipe::parse_amount("2");
    r.ingredients.push_back(recipe::IngredientEntry::make(starred));

    recipe::Ingredient numbered;
    numbered.name = "1. pinch of salt";
    r.ingredients.push_back(recipe::IngredientEntry::make(numbered));

    const recipe::Recipe back = reparse(r);

    EXPECT_EQ(back.title, "Pie *deluxe*");
    ASSERT_EQ(back.tags.size(), 1u);
    EXPECT_EQ(back.tags[0], "x_y");
    ASSERT_EQ(back.ingredients.size(), 2u);
    EXPECT_EQ(back.ingredients[0].ingredient.name, "a*b");
    EXPECT_DOUBLE_EQ(*back.ingredients[0].ingredient.amount->quantity, 2.0);
    EXPECT_EQ(back.ingredients[1].ingredient.name, "1. pinch of salt");
    EXPECT_FALSE(back.ingredients[1].ingredient.amount.has_value());
}

TEST(MarkdownRendererTest, LinksWithSpacesSurviveRoundTrip) {
    recipe::Recipe r;
    r.title = "Tart";

    recipe::Ingredient crust;
    crust.name = "short crust";
    crust.link = "../basics/short crust.md";
    r.ingredients.push_back(recipe::IngredientEntry::make(crust));

    const recipe::Recipe back = reparse(r);

    ASSERT_EQ(back.ingredients.size(), 1u);
    ASSERT_TRUE(back.ingredients[0].ingredient.link.has_value());
    EXPECT_EQ(*back.ingredients[0].ingredient.link, "../basics/short crust.md");
}

TEST(MarkdownRendererTest, DuplicateMetadataDoesNotComeBack) {
    const recipe::ParseResult first = recipe::parse_recipe_markdown("# Cake\n\n*a, b*\n\n*c*\n\n---\n");
    ASSERT_EQ(first.warnings.size(), 1u);

    const recipe::ParseResult second = recipe::parse_recipe_markdown(recipe::render_markdown(first.recipe));

    EXPECT_TRUE(second.warnings.empty());
    EXPECT_EQ(second.recipe.tags, first.recipe.tags);
    EXPECT_EQ(second.recipe.description, first.recipe.description);
}

TEST(MarkdownRendererTest, ExportReconstructReparseExportIsFixedPoint) {
    const nlohmann::json exported = recipe::recipe_to_json(recipe::parse_recipe_markdown(fixtures::apple_pie()).recipe);

    const recipe::Recipe imported = recipe::recipe_from_json(exported);
    const recipe::Recipe reparsed = reparse(imported);

    EXPECT_EQ(recipe::recipe_to_json(reparsed), exported);
}

TEST(MarkdownRendererTest, EscapedDividerInDescriptionStaysText) {
    const std::string source = "# Pasta\n\n\\---\n\n---\n\n- flour\n\n---\n\nBoil.\n";
    const recipe::ParseResult first = recipe::parse_recipe_markdown(source);
    ASSERT_EQ(first.recipe.description.size(), 1u);
    EXPECT_EQ(first.recipe.description[0], "\\---");

    const recipe::ParseResult second = recipe::parse_recipe_markdown(recipe::render_markdown(first.recipe));
    EXPECT_EQ(second.recipe.description, first.recipe.description);
    ASSERT_EQ(second.recipe.ingredients.size(), 1u);
    EXPECT_EQ(second.recipe.ingredients[0].ingredient.name, "flour");
    EXPECT_EQ(second.recipe.instructions, first.recipe.instructions);
}

TEST(MarkdownRendererTest, TrailingHashInTitleSurvives) {
    const recipe::ParseResult first = recipe::parse_recipe_markdown("# Pasta \\#\n\n---\n\n---\n");
    EXPECT_EQ(first.recipe.title, "Pasta #");

    const std::string md = recipe::render_markdown(first.recipe);
    EXPECT_EQ(md.rfind("# Pasta \\#\n", 0), 0u);
    EXPECT_EQ(reparse(first.recipe).title, "Pasta #");
}

TEST(MarkdownRendererTest, AmpersandAndEntitiesStayLiteral) {
    const recipe::ParseResult first =
        recipe::parse_recipe_markdown("# Fish \\& chips &lt;3\n\nFish \\& chips &lt;3\n\n---\n\n---\n");
    EXPECT_EQ(first.recipe.title, "Fish & chips <3");
    ASSERT_EQ(first.recipe.description.size(), 1u);
    EXPECT_EQ(first.recipe.description[0], "Fish \\& chips \\<3");

    const recipe::Recipe second = reparse(first.recipe);
    EXPECT_EQ(second.title, "Fish & chips <3");
    EXPECT_EQ(second.description, first.recipe.description);
}
