#include "recipe/RecipeParser.hpp"

#include "md/Md4cParser.hpp"
#include "recipe/IngredientGroupBuilder.hpp"
#include "recipe/MetadataClassifier.hpp"
#include "recipe/TextUtil.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace recipe {

ParseResult parse_recipe(const md::Block& document, const ParseOptions& opts) {
    ParseResult res;

    const Sections sections = segment_sections(document.children, opts.mode, res.warnings);

    MetadataClassifier classifier;
    Metadata meta = classifier.classify(sections.metadata, res.warnings);

    if (!meta.has_title) {
        throw StructureError(StructureError::Code::MissingTitle, "no level-1 heading found for the recipe title");
    }
    if (meta.title.empty()) {
        throw StructureError(StructureError::Code::MissingTitle, "recipe title heading is empty");
    }

    Recipe& r = res.recipe;
    r.title = std::move(meta.title);
    r.description = std::move(meta.description);
    r.tags = std::move(meta.tags);
    r.yields = std::move(meta.yields);
    r.ingredients = build_ingredient_tree(sections.ingredients, res.warnings);

    for (const md::Block* b : sections.instructions) {
        std::string block_md = md::to_markdown(*b);
        if (!textutil::trim(block_md).empty()) r.instructions.push_back(std::move(block_md));
    }

    return res;
}

ParseResult parse_recipe_markdown(const std::string& source, const ParseOptions& opts) {
    const md::Block doc = md::parse_document(source);
    return parse_recipe(doc, opts);
}

std::string read_text_file(const fs::path& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) throw std::runtime_error("failed to open: " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void write_text_file(const fs::path& path, const std::string& text) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());

    out << text;
    if (text.empty() || text.back() != '\n') out << "\n";
}

ParseResult load_recipe_file(const fs::path& path, const ParseOptions& opts) {
    return parse_recipe_markdown(read_text_file(path), opts);
}

}  // namespace recipe
