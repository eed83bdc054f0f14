#include "recipe/SectionSegmenter.hpp"

#include <string>

namespace recipe {

Sections segment_sections(const std::vector<md::Block>& blocks, ParseMode mode, Warnings& warnings) {
    Sections s;

    const size_t npos = blocks.size();
    size_t first = npos;
    size_t second = npos;

    for (size_t i = 0; i < blocks.size(); ++i) {
        if (blocks[i].kind != md::BlockKind::ThematicBreak) continue;
        ++s.divider_count;
        if (first == npos) {
            first = i;
        } else if (second == npos) {
            second = i;
        }
    }

    if (first == npos) {
        if (mode == ParseMode::Strict) {
            throw StructureError(StructureError::Code::MissingDivider,
                                 "no thematic break (---) separating metadata from ingredients");
        }
        add_warning(warnings, WarningKind::Structure, "missing_divider",
                    "no thematic break found; whole document treated as metadata");
        for (const auto& b : blocks) s.metadata.push_back(&b);
        return s;
    }

    for (size_t i = 0; i < first; ++i) s.metadata.push_back(&blocks[i]);

    const size_t ing_end = (second == npos) ? blocks.size() : second;
    for (size_t i = first + 1; i < ing_end; ++i) s.ingredients.push_back(&blocks[i]);

    // a third divider onwards is ordinary instruction content
    if (second != npos) {
        for (size_t i = second + 1; i < blocks.size(); ++i) s.instructions.push_back(&blocks[i]);
    }

    return s;
}

}  // namespace recipe
