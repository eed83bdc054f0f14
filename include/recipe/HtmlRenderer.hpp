#pragma once

#include <string>

#include "recipe/Models.hpp"

namespace recipe {

struct HtmlOptions {
    bool schema_org = false;   // add itemscope/itemprop microdata (schema.org/Recipe)
    bool standalone = false;   // wrap the article in a full page with a stylesheet
};

// Presentation markup for a recipe: an <article class="recipe"> fragment,
// or a complete page when opts.standalone is set. Description and instruction
// blocks go through md4c-html.
std::string render_html(const Recipe& r, const HtmlOptions& opts = HtmlOptions{});

std::string html_escape(const std::string& s);

}  // namespace recipe
