#include "recipe/MarkdownRenderer.hpp"

#include "md/Document.hpp"
#include "recipe/TextUtil.hpp"

namespace recipe {

static std::string amount_md(const Amount& a) {
    const std::string text = textutil::trim(a.original_text);
    if (text.empty()) return std::string();
    return "*" + md::escape_text(text) + "*";
}

static std::string ingredient_line(const Ingredient& ing) {
    std::string line = "- ";

    std::string amount;
    if (ing.amount) amount = amount_md(*ing.amount);
    if (!amount.empty()) line += amount + " ";

    const std::string name = md::escape_text(ing.name);
    if (ing.link) {
        const std::string& dest = *ing.link;
        line += "[" + name + "](" + (dest.find(' ') != std::string::npos ? "<" + dest + ">" : dest) + ")";
    } else {
        line += amount.empty() ? md::escape_line_start(name) : name;
    }
    return line;
}

static void render_entries(const std::vector<IngredientEntry>& entries, std::string& out) {
    bool in_list = false;

    for (const auto& e : entries) {
        if (!e.is_group()) {
            out += ingredient_line(e.ingredient) + "\n";
            in_list = true;
            continue;
        }

        if (in_list) {
            out += "\n";
            in_list = false;
        }

        int level = e.group.level;
        if (level < 1) level = 1;
        if (level > 6) level = 6;
        out += std::string(static_cast<size_t>(level), '#') + " " + md::escape_heading_end(md::escape_text(e.group.name)) + "\n\n";

        render_entries(e.group.children, out);
    }

    if (in_list) out += "\n";
}

std::string render_markdown(const Recipe& r) {
    std::string out;

    out += "# " + md::escape_heading_end(md::escape_text(r.title)) + "\n\n";

    for (const auto& block : r.description) {
        out += block + "\n\n";
    }

    if (!r.tags.empty()) {
        std::vector<std::string> tags;
        tags.reserve(r.tags.size());
        for (const auto& t : r.tags) tags.push_back(md::escape_text(textutil::trim(t)));
        out += "*" + textutil::join(tags, ", ") + "*\n\n";
    }

    if (!r.yields.empty()) {
        std::vector<std::string> yields;
        yields.reserve(r.yields.size());
        for (const auto& y : r.yields) {
            const std::string text = textutil::trim(y.original_text);
            if (!text.empty()) yields.push_back(md::escape_text(text));
        }
        if (!yields.empty()) out += "**" + textutil::join(yields, ", ") + "**\n\n";
    }

    out += "---\n\n";

    render_entries(r.ingredients, out);

    out += "---\n";

    for (const auto& block : r.instructions) {
        out += "\n" + block + "\n";
    }

    return out;
}

}  // namespace recipe
