#pragma once

#include <string>
#include <vector>

#include "md/Document.hpp"
#include "recipe/Diagnostics.hpp"
#include "recipe/Models.hpp"

namespace recipe {

struct Metadata {
    bool has_title = false;
    std::string title;
    std::vector<std::string> description;   // markdown text blocks
    std::vector<std::string> tags;
    std::vector<Amount> yields;
};

class MetadataClassifier {
public:
    enum class ParagraphRole {
        Description,
        Tags,     // exactly one child: *single emphasis*
        Yields    // exactly one child: **double emphasis**
    };

    static ParagraphRole classify_paragraph(const md::Block& paragraph);

    Metadata classify(const std::vector<const md::Block*>& nodes, Warnings& warnings) const;

private:
    static std::string plain_block(const std::string& text);
};

}  // namespace recipe
