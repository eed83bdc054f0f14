#include "recipe/IngredientLineParser.hpp"

#include "recipe/AmountParser.hpp"
#include "recipe/TextUtil.hpp"

#include <string>

namespace recipe {

static void collect_links(const md::Inline& n, std::vector<const md::Inline*>& out) {
    if (n.kind == md::InlineKind::Link) {
        out.push_back(&n);
        return;
    }
    for (const auto& c : n.children) collect_links(c, out);
}

std::optional<Ingredient> parse_ingredient_line(const std::vector<md::Inline>& inlines, Warnings& warnings) {
    Ingredient ing;
    size_t start = 0;

    if (!inlines.empty() &&
        inlines.front().kind == md::InlineKind::Emphasis &&
        inlines.front().level == 1) {
        const std::string amount_text = md::flatten_text(inlines.front());
        if (!textutil::trim(amount_text).empty()) {
            ing.amount = parse_amount(amount_text, &warnings);
        }
        start = 1;
    }

    std::vector<const md::Inline*> links;
    std::string name;
    for (size_t i = start; i < inlines.size(); ++i) {
        collect_links(inlines[i], links);
        name += md::flatten_text(inlines[i]);
    }

    ing.name = textutil::trim(name);

    if (links.size() == 1 && !links.front()->text.empty()) {
        ing.link = links.front()->text;
    }

    if (ing.name.empty()) {
        std::string what = md::flatten_text(inlines);
        add_warning(warnings, WarningKind::Content, "empty_ingredient",
                    "ingredient without a name dropped: \"" + textutil::trim(what) + "\"");
        return std::nullopt;
    }

    return ing;
}

}  // namespace recipe
