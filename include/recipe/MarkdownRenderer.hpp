#pragma once

#include <string>

#include "recipe/Models.hpp"

namespace recipe {

// Rebuild recipe markdown in canonical layout:
//   # title, description, *tags*, **yields**, ---, ingredients, ---, instructions
// Parsing the output again yields an equal Recipe.
std::string render_markdown(const Recipe& r);

}  // namespace recipe
