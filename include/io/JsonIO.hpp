#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "recipe/Models.hpp"

namespace recipe {

// Structured export. Fixed schema:
//   title, description, tags[], yields[{factor, unit}],
//   ingredients[{name, amount{factor, unit}, link}],
//   ingredient_groups[{title, ingredients[], ingredient_groups[]}], instructions
// `factor` is always the amount's original text, never the parsed number.
nlohmann::json recipe_to_json(const Recipe& r);

std::string render_json(const Recipe& r);

// Inverse of recipe_to_json. Throws std::runtime_error naming the offending
// path ("root.ingredient_groups[0].title must be a string").
Recipe recipe_from_json(const nlohmann::json& j);

Recipe load_recipe_json(const std::string& path);

}  // namespace recipe
