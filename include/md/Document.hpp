#pragma once

#include <string>
#include <vector>

namespace md {

enum class BlockKind {
    Document,
    Paragraph,
    Heading,
    List,
    ListItem,
    ThematicBreak,
    CodeBlock,
    BlockQuote,
    Html,
    Other
};

enum class InlineKind {
    Text,
    SoftBreak,
    HardBreak,
    Emphasis,    // level 1 = *em*, level 2 = **strong**
    Link,        // text = destination
    Image,       // text = source
    CodeSpan,
    Other
};

struct Inline {
    InlineKind kind = InlineKind::Text;
    int level = 0;
    std::string text;
    std::vector<Inline> children;
};

struct Block {
    BlockKind kind = BlockKind::Paragraph;
    int heading_level = 0;
    bool ordered = false;
    int list_start = 1;
    std::string info;                // code fence info string
    std::string literal;             // code / html block raw text
    std::vector<Inline> inlines;     // paragraph, heading, tight list item content
    std::vector<Block> children;     // nested blocks
};

// Plain text of inline content. Soft breaks become spaces, hard breaks newlines.
std::string flatten_text(const std::vector<Inline>& inlines);
std::string flatten_text(const Inline& node);

// Inline content of a list item, whether the item is tight or loose.
const std::vector<Inline>& item_inlines(const Block& item);

// Emphasis level of a paragraph that consists of exactly one emphasis run
// and nothing else; 0 otherwise.
int sole_emphasis_level(const Block& paragraph);

// Backslash-escape characters that would otherwise start inline markup
// (emphasis, links, code, entities, raw HTML).
std::string escape_text(const std::string& text);

// Escape a block marker at the start of a line ("# ", "- ", "1. ", "---",
// "> ", setext "===") so the line stays paragraph text.
std::string escape_line_start(const std::string& line);

// Escape a trailing run of '#' that would read as an ATX closing sequence.
std::string escape_heading_end(const std::string& content);

// Re-emit one block as a markdown snippet (no trailing newline).
std::string to_markdown(const Block& block);

std::string inlines_to_markdown(const std::vector<Inline>& inlines);

}  // namespace md
