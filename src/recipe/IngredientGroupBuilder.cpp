#include "recipe/IngredientGroupBuilder.hpp"

#include "recipe/IngredientLineParser.hpp"
#include "recipe/TextUtil.hpp"

#include <optional>
#include <utility>

namespace recipe {

IngredientGroupBuilder::IngredientGroupBuilder(Warnings& warnings) : warnings_(warnings) {}

// Only the innermost open group (or the top level, when nothing is open)
// ever grows, so the group pointers held on the stack are never invalidated.
std::vector<IngredientEntry>& IngredientGroupBuilder::current_children() {
    if (stack_.empty()) return entries_;
    return stack_.back().group->children;
}

void IngredientGroupBuilder::add_heading(int level, const std::string& name) {
    if (level < 1) level = 1;
    if (level > 6) level = 6;

    while (!stack_.empty() && stack_.back().level >= level) stack_.pop_back();

    IngredientGroup g;
    g.name = name;
    g.level = level;

    std::vector<IngredientEntry>& siblings = current_children();
    siblings.push_back(IngredientEntry::make(std::move(g)));

    OpenGroup og;
    og.level = level;
    og.group = &siblings.back().group;
    stack_.push_back(og);
}

void IngredientGroupBuilder::add_ingredient(Ingredient ing) {
    current_children().push_back(IngredientEntry::make(std::move(ing)));
}

void IngredientGroupBuilder::add_list(const md::Block& list) {
    for (const auto& item : list.children) {
        if (item.kind != md::BlockKind::ListItem) continue;
        std::optional<Ingredient> ing = parse_ingredient_line(md::item_inlines(item), warnings_);
        if (ing) add_ingredient(std::move(*ing));
    }
}

void IngredientGroupBuilder::add_block(const md::Block& block) {
    switch (block.kind) {
        case md::BlockKind::Heading:
            add_heading(block.heading_level, textutil::trim(md::flatten_text(block.inlines)));
            break;
        case md::BlockKind::List:
            add_list(block);
            break;
        default: {
            const std::string text = textutil::trim(md::to_markdown(block));
            add_warning(warnings_, WarningKind::Content, "unexpected_block",
                        "ignored non-list block in ingredient section: \"" + textutil::truncate_utf8(text, 60) + "\"");
            break;
        }
    }
}

std::vector<IngredientEntry> IngredientGroupBuilder::take_entries() {
    stack_.clear();
    return std::move(entries_);
}

std::vector<IngredientEntry> build_ingredient_tree(const std::vector<const md::Block*>& nodes, Warnings& warnings) {
    IngredientGroupBuilder builder(warnings);
    for (const md::Block* b : nodes) {
        if (b) builder.add_block(*b);
    }
    return builder.take_entries();
}

}  // namespace recipe
