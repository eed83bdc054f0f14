#pragma once

#include <string>
#include <vector>

#include "md/Document.hpp"
#include "recipe/Diagnostics.hpp"
#include "recipe/Models.hpp"

namespace recipe {

// Builds the ingredient tree from the ingredient section. Headings open
// groups; a heading closes every open group of the same or a deeper level
// first, so equal levels become siblings. List items land in the innermost
// open group, or at top level when none is open.
class IngredientGroupBuilder {
public:
    explicit IngredientGroupBuilder(Warnings& warnings);

    void add_block(const md::Block& block);
    void add_heading(int level, const std::string& name);
    void add_list(const md::Block& list);
    void add_ingredient(Ingredient ing);

    std::vector<IngredientEntry> take_entries();

private:
    struct OpenGroup {
        int level = 0;
        IngredientGroup* group = nullptr;
    };

    std::vector<IngredientEntry>& current_children();

    Warnings& warnings_;
    std::vector<IngredientEntry> entries_;
    std::vector<OpenGroup> stack_;
};

std::vector<IngredientEntry> build_ingredient_tree(const std::vector<const md::Block*>& nodes, Warnings& warnings);

}  // namespace recipe
