#pragma once

#include <vector>

#include "md/Document.hpp"
#include "recipe/Diagnostics.hpp"

namespace recipe {

enum class ParseMode {
    Strict,       // missing divider is a StructureError
    Permissive    // missing divider is a warning, everything is metadata
};

struct Sections {
    std::vector<const md::Block*> metadata;      // before the first divider
    std::vector<const md::Block*> ingredients;   // between first and second divider
    std::vector<const md::Block*> instructions;  // after the second divider, later dividers included
    int divider_count = 0;
};

// Partition top-level blocks by the first two thematic breaks. The returned
// pointers refer into `blocks`, which must outlive the result.
Sections segment_sections(const std::vector<md::Block>& blocks, ParseMode mode, Warnings& warnings);

}  // namespace recipe
