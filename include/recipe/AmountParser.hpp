#pragma once

#include <optional>
#include <string>

#include "recipe/Diagnostics.hpp"
#include "recipe/Models.hpp"

namespace recipe {

// Value of a single Unicode vulgar fraction codepoint (U+00BC..U+00BE,
// U+2150..U+215E, U+2189); none for anything else.
std::optional<double> vulgar_fraction_value(char32_t cp);

// Parse "2 1/4 cups", "1,5 kg", "½ tsp", "3", "a pinch" into quantity + unit.
// original_text is always the input span as given. Zero denominators and
// malformed fractions/decimals leave quantity empty, keep the trimmed span as
// unit, and add an amount_parse_failure warning if `warnings` is non-null.
Amount parse_amount(const std::string& span, Warnings* warnings = nullptr);

}  // namespace recipe
