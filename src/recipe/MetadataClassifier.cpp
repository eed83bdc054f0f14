#include "recipe/MetadataClassifier.hpp"

#include "recipe/AmountParser.hpp"
#include "recipe/TextUtil.hpp"

namespace recipe {

MetadataClassifier::ParagraphRole MetadataClassifier::classify_paragraph(const md::Block& paragraph) {
    switch (md::sole_emphasis_level(paragraph)) {
        case 1: return ParagraphRole::Tags;
        case 2: return ParagraphRole::Yields;
        default: return ParagraphRole::Description;
    }
}

// Text that lost its role (second title, second tags line) goes into the
// description as plain text, so it cannot be re-detected on the next parse.
std::string MetadataClassifier::plain_block(const std::string& text) {
    return md::escape_line_start(md::escape_text(textutil::trim(text)));
}

Metadata MetadataClassifier::classify(const std::vector<const md::Block*>& nodes, Warnings& warnings) const {
    Metadata m;
    bool have_tags = false;
    bool have_yields = false;

    for (const md::Block* node : nodes) {
        if (!node) continue;
        const md::Block& b = *node;

        if (b.kind == md::BlockKind::Heading && b.heading_level == 1) {
            const std::string text = textutil::trim(md::flatten_text(b.inlines));
            if (!m.has_title) {
                m.has_title = true;
                m.title = text;
            } else {
                add_warning(warnings, WarningKind::Ambiguity, "duplicate_title",
                            "second title heading \"" + text + "\" moved into the description");
                if (!text.empty()) m.description.push_back(plain_block(text));
            }
            continue;
        }

        if (b.kind == md::BlockKind::Paragraph) {
            const ParagraphRole role = classify_paragraph(b);
            const std::string text = md::flatten_text(b.inlines);

            if (role == ParagraphRole::Tags) {
                if (!have_tags) {
                    have_tags = true;
                    m.tags = textutil::split_commas(text);
                } else {
                    add_warning(warnings, WarningKind::Ambiguity, "duplicate_tags",
                                "additional tags paragraph \"" + textutil::trim(text) + "\" moved into the description");
                    m.description.push_back(plain_block(text));
                }
                continue;
            }

            if (role == ParagraphRole::Yields) {
                if (!have_yields) {
                    have_yields = true;
                    for (const auto& seg : textutil::split_commas(text)) {
                        m.yields.push_back(parse_amount(seg, &warnings));
                    }
                } else {
                    add_warning(warnings, WarningKind::Ambiguity, "duplicate_yields",
                                "additional yields paragraph \"" + textutil::trim(text) + "\" moved into the description");
                    m.description.push_back(plain_block(text));
                }
                continue;
            }
        }

        // plain paragraphs and any other block (lists, quotes, code, h2+)
        const std::string block_md = md::to_markdown(b);
        if (!textutil::trim(block_md).empty()) m.description.push_back(block_md);
    }

    return m;
}

}  // namespace recipe
