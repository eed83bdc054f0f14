#pragma once

#include <optional>
#include <vector>

#include "md/Document.hpp"
#include "recipe/Diagnostics.hpp"
#include "recipe/Models.hpp"

namespace recipe {

// One list item's inline content -> ingredient.
//   "*2 1/4 cups* all-purpose flour"  -> amount + name
//   "[pie crust](./pie-crust.md)"      -> name + link
// Only a leading *single emphasis* is an amount. Returns none (and records an
// empty_ingredient warning) when the name is empty after trimming.
std::optional<Ingredient> parse_ingredient_line(const std::vector<md::Inline>& inlines, Warnings& warnings);

}  // namespace recipe
