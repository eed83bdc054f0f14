#include "recipe/HtmlRenderer.hpp"

#include "md/Md4cHtml.hpp"
#include "recipe/TextUtil.hpp"

#include <string>
#include <vector>

namespace recipe {

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 32);
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;";  break;
            case '<': out += "&lt;";   break;
            case '>': out += "&gt;";   break;
            case '"': out += "&quot;"; break;
            default:  out += c;        break;
        }
    }
    return out;
}

static std::string itemprop(const HtmlOptions& opts, const char* name) {
    if (!opts.schema_org) return std::string();
    return std::string(" itemprop=\"") + name + "\"";
}

static std::string render_text_blocks(const std::vector<std::string>& blocks) {
    std::string html;
    for (const auto& b : blocks) html += md::markdown_to_html(b);
    return html;
}

static std::string render_ingredient(const Ingredient& ing, const HtmlOptions& opts) {
    std::string html = "<li class=\"ingredient\"" + itemprop(opts, "recipeIngredient") + ">";

    if (ing.amount && !textutil::trim(ing.amount->original_text).empty()) {
        html += "<span class=\"amount\">" + html_escape(textutil::trim(ing.amount->original_text)) + "</span> ";
    }

    if (ing.link) {
        html += "<a class=\"name\" href=\"" + html_escape(*ing.link) + "\">" + html_escape(ing.name) + "</a>";
    } else {
        html += "<span class=\"name\">" + html_escape(ing.name) + "</span>";
    }

    html += "</li>\n";
    return html;
}

static void render_entries(const std::vector<IngredientEntry>& entries, const HtmlOptions& opts, std::string& html) {
    bool in_ul = false;

    for (const auto& e : entries) {
        if (!e.is_group()) {
            if (!in_ul) {
                html += "<ul class=\"ingredient-list\">\n";
                in_ul = true;
            }
            html += render_ingredient(e.ingredient, opts);
            continue;
        }

        if (in_ul) {
            html += "</ul>\n";
            in_ul = false;
        }

        // h1 belongs to the recipe title
        int level = e.group.level;
        if (level < 2) level = 2;
        if (level > 6) level = 6;
        const std::string tag = "h" + std::to_string(level);

        html += "<section class=\"ingredient-group\">\n";
        html += "<" + tag + " class=\"ingredient-group-title\">" + html_escape(e.group.name) + "</" + tag + ">\n";
        render_entries(e.group.children, opts, html);
        html += "</section>\n";
    }

    if (in_ul) html += "</ul>\n";
}

static std::string render_article(const Recipe& r, const HtmlOptions& opts) {
    std::string html;
    html.reserve(4096);

    html += "<article class=\"recipe\"";
    if (opts.schema_org) html += " itemscope itemtype=\"https://schema.org/Recipe\"";
    html += ">\n";

    html += "<h1 class=\"title\"" + itemprop(opts, "name") + ">" + html_escape(r.title) + "</h1>\n";

    if (!r.description.empty()) {
        html += "<div class=\"description\"" + itemprop(opts, "description") + ">\n";
        html += render_text_blocks(r.description);
        html += "</div>\n";
    }

    if (!r.tags.empty()) {
        html += "<div class=\"tags\">";
        for (size_t i = 0; i < r.tags.size(); ++i) {
            if (i) html += " ";
            html += "<span class=\"tag\"" + itemprop(opts, "keywords") + ">" + html_escape(r.tags[i]) + "</span>";
        }
        html += "</div>\n";
    }

    if (!r.yields.empty()) {
        html += "<div class=\"yields\">";
        for (size_t i = 0; i < r.yields.size(); ++i) {
            if (i) html += ", ";
            html += "<span class=\"yield\"" + itemprop(opts, "recipeYield") + ">" +
                    html_escape(textutil::trim(r.yields[i].original_text)) + "</span>";
        }
        html += "</div>\n";
    }

    html += "<section class=\"ingredients\">\n";
    render_entries(r.ingredients, opts, html);
    html += "</section>\n";

    html += "<section class=\"instructions\"" + itemprop(opts, "recipeInstructions") + ">\n";
    html += render_text_blocks(r.instructions);
    html += "</section>\n";

    html += "</article>\n";
    return html;
}

static std::string wrap_page(const std::string& title, const std::string& body) {
    std::string html;
    html.reserve(body.size() + 1024);

    html += "<!doctype html>\n";
    html += "<html>\n<head>\n";
    html += "<meta charset=\"utf-8\"/>\n";
    html += "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\"/>\n";
    html += "<title>" + html_escape(title) + "</title>\n";
    html += "<style>\n";
    html += "  body { font-family: Georgia, 'Times New Roman', serif; font-size: 12pt; line-height: 1.45; max-width: 42em; margin: 2em auto; padding: 0 1em; }\n";
    html += "  h1 { font-size: 22pt; margin: 0 0 8px 0; }\n";
    html += "  h2 { font-size: 14pt; margin: 14px 0 6px 0; }\n";
    html += "  h3 { font-size: 12pt; margin: 10px 0 4px 0; }\n";
    html += "  p  { margin: 0 0 6px 0; }\n";
    html += "  ul, ol { margin: 0 0 8px 22px; padding: 0; }\n";
    html += "  li { margin: 0 0 3px 0; }\n";
    html += "  .tags .tag { display: inline-block; padding: 0 6px; margin-right: 4px; border: 1px solid #bbb; border-radius: 3px; font-size: 10pt; }\n";
    html += "  .yields { font-weight: bold; margin: 6px 0; }\n";
    html += "  .ingredients { border-top: 1px solid #ccc; border-bottom: 1px solid #ccc; padding: 8px 0; margin: 12px 0; }\n";
    html += "  .amount { font-style: italic; }\n";
    html += "</style>\n";
    html += "</head>\n<body>\n";
    html += body;
    html += "</body>\n</html>\n";
    return html;
}

std::string render_html(const Recipe& r, const HtmlOptions& opts) {
    const std::string article = render_article(r, opts);
    if (!opts.standalone) return article;
    return wrap_page(r.title, article);
}

}  // namespace recipe
