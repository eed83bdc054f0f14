#pragma once

#include <filesystem>
#include <string>

#include "md/Document.hpp"
#include "recipe/Diagnostics.hpp"
#include "recipe/Models.hpp"
#include "recipe/SectionSegmenter.hpp"

namespace recipe {

struct ParseOptions {
    ParseMode mode = ParseMode::Strict;
};

struct ParseResult {
    Recipe recipe;
    Warnings warnings;
};

// Extract a recipe from an already parsed document. Throws StructureError
// when there is no title, or no divider in strict mode.
ParseResult parse_recipe(const md::Block& document, const ParseOptions& opts = ParseOptions{});

// Same, starting from markdown source.
ParseResult parse_recipe_markdown(const std::string& source, const ParseOptions& opts = ParseOptions{});

// Read and parse a recipe file. Throws std::runtime_error if it can't be read.
ParseResult load_recipe_file(const std::filesystem::path& path, const ParseOptions& opts = ParseOptions{});

std::string read_text_file(const std::filesystem::path& path);
void write_text_file(const std::filesystem::path& path, const std::string& text);

}  // namespace recipe
