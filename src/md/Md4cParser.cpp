#include "md/Md4cParser.hpp"

#include <md4c.h>

#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace md {

static void append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x110000) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out += "\xEF\xBF\xBD";
    }
}

// md4c hands entities over verbatim; resolve the ones recipes actually use.
static std::string decode_entity(const std::string& ent) {
    if (ent == "&amp;") return "&";
    if (ent == "&lt;") return "<";
    if (ent == "&gt;") return ">";
    if (ent == "&quot;") return "\"";
    if (ent == "&apos;") return "'";
    if (ent == "&nbsp;") return "\xC2\xA0";

    if (ent.size() > 3 && ent[0] == '&' && ent[1] == '#' && ent.back() == ';') {
        const bool hex = (ent[2] == 'x' || ent[2] == 'X');
        const std::string digits = ent.substr(hex ? 3 : 2, ent.size() - (hex ? 4 : 3));
        if (!digits.empty()) {
            char* end = nullptr;
            const unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
            if (end && *end == '\0') {
                std::string out;
                append_utf8(out, cp == 0 ? 0xFFFD : cp);
                return out;
            }
        }
    }
    return ent;
}

namespace {

struct TreeBuilder {
    ParserLimits limits;
    std::string error;

    Block root;
    std::vector<Block*> block_stack;
    std::vector<Inline*> inline_stack;
    std::size_t node_count = 0;

    explicit TreeBuilder(const ParserLimits& l) : limits(l) {
        root.kind = BlockKind::Document;
        block_stack.push_back(&root);
    }

    bool fail(const std::string& e) {
        if (error.empty()) error = e;
        return false;
    }

    bool bump_nodes() {
        if (++node_count > limits.max_nodes) return fail("markdown document too complex (node limit exceeded)");
        return true;
    }

    Block* current_block() {
        return block_stack.empty() ? nullptr : block_stack.back();
    }

    std::vector<Inline>* current_inlines() {
        if (!inline_stack.empty()) return &inline_stack.back()->children;
        Block* b = current_block();
        return b ? &b->inlines : nullptr;
    }

    // Pointers on the stacks stay valid: only the innermost open node ever
    // gains children, and its already-closed siblings are never referenced.
    bool push_block(BlockKind kind) {
        if (!bump_nodes()) return false;
        Block* parent = current_block();
        if (!parent) return fail("internal parser error (no current block)");
        parent->children.emplace_back();
        Block* b = &parent->children.back();
        b->kind = kind;
        block_stack.push_back(b);
        if (static_cast<int>(block_stack.size()) > limits.max_depth) return fail("markdown nesting too deep");
        return true;
    }

    void pop_block() {
        if (block_stack.size() > 1) block_stack.pop_back();
    }

    bool push_inline(InlineKind kind, int level) {
        if (!bump_nodes()) return false;
        std::vector<Inline>* list = current_inlines();
        if (!list) return fail("internal parser error (no inline list)");
        list->emplace_back();
        Inline* n = &list->back();
        n->kind = kind;
        n->level = level;
        inline_stack.push_back(n);
        if (static_cast<int>(inline_stack.size()) > limits.max_depth) return fail("markdown nesting too deep");
        return true;
    }

    void pop_inline() {
        if (!inline_stack.empty()) inline_stack.pop_back();
    }

    bool append_text(InlineKind kind, const std::string& s) {
        std::vector<Inline>* list = current_inlines();
        if (!list) return fail("internal parser error (no inline list)");

        // md4c splits text at entities and other boundaries; keep one run.
        if (kind == InlineKind::Text && !list->empty() && list->back().kind == InlineKind::Text) {
            list->back().text += s;
            return true;
        }

        if (!bump_nodes()) return false;
        Inline n;
        n.kind = kind;
        n.text = s;
        list->push_back(std::move(n));
        return true;
    }
};

}  // namespace

static std::string attribute_text(const MD_ATTRIBUTE& attr) {
    if (!attr.text || attr.size == 0) return std::string();
    return std::string(attr.text, attr.size);
}

static int enter_block_cb(MD_BLOCKTYPE type, void* detail, void* userdata) {
    TreeBuilder& b = *static_cast<TreeBuilder*>(userdata);
    if (!b.error.empty()) return 1;

    switch (type) {
        case MD_BLOCK_DOC:
            return 0;
        case MD_BLOCK_P:
            return b.push_block(BlockKind::Paragraph) ? 0 : 1;
        case MD_BLOCK_H: {
            if (!b.push_block(BlockKind::Heading)) return 1;
            const auto* h = static_cast<const MD_BLOCK_H_DETAIL*>(detail);
            b.current_block()->heading_level = h ? static_cast<int>(h->level) : 1;
            return 0;
        }
        case MD_BLOCK_UL:
            return b.push_block(BlockKind::List) ? 0 : 1;
        case MD_BLOCK_OL: {
            if (!b.push_block(BlockKind::List)) return 1;
            Block* list = b.current_block();
            list->ordered = true;
            const auto* ol = static_cast<const MD_BLOCK_OL_DETAIL*>(detail);
            if (ol) list->list_start = static_cast<int>(ol->start);
            return 0;
        }
        case MD_BLOCK_LI:
            return b.push_block(BlockKind::ListItem) ? 0 : 1;
        case MD_BLOCK_HR:
            return b.push_block(BlockKind::ThematicBreak) ? 0 : 1;
        case MD_BLOCK_QUOTE:
            return b.push_block(BlockKind::BlockQuote) ? 0 : 1;
        case MD_BLOCK_CODE: {
            if (!b.push_block(BlockKind::CodeBlock)) return 1;
            const auto* cd = static_cast<const MD_BLOCK_CODE_DETAIL*>(detail);
            if (cd) b.current_block()->info = attribute_text(cd->info);
            return 0;
        }
        case MD_BLOCK_HTML:
            return b.push_block(BlockKind::Html) ? 0 : 1;
        default:
            return b.push_block(BlockKind::Other) ? 0 : 1;
    }
}

static int leave_block_cb(MD_BLOCKTYPE type, void*, void* userdata) {
    TreeBuilder& b = *static_cast<TreeBuilder*>(userdata);
    if (!b.error.empty()) return 1;
    if (type != MD_BLOCK_DOC) b.pop_block();
    return 0;
}

static int enter_span_cb(MD_SPANTYPE type, void* detail, void* userdata) {
    TreeBuilder& b = *static_cast<TreeBuilder*>(userdata);
    if (!b.error.empty()) return 1;

    switch (type) {
        case MD_SPAN_EM:
            return b.push_inline(InlineKind::Emphasis, 1) ? 0 : 1;
        case MD_SPAN_STRONG:
            return b.push_inline(InlineKind::Emphasis, 2) ? 0 : 1;
        case MD_SPAN_CODE:
            return b.push_inline(InlineKind::CodeSpan, 0) ? 0 : 1;
        case MD_SPAN_A: {
            if (!b.push_inline(InlineKind::Link, 0)) return 1;
            const auto* a = static_cast<const MD_SPAN_A_DETAIL*>(detail);
            if (a) b.inline_stack.back()->text = attribute_text(a->href);
            return 0;
        }
        case MD_SPAN_IMG: {
            if (!b.push_inline(InlineKind::Image, 0)) return 1;
            const auto* img = static_cast<const MD_SPAN_IMG_DETAIL*>(detail);
            if (img) b.inline_stack.back()->text = attribute_text(img->src);
            return 0;
        }
        default:
            return b.push_inline(InlineKind::Other, 0) ? 0 : 1;
    }
}

static int leave_span_cb(MD_SPANTYPE, void*, void* userdata) {
    TreeBuilder& b = *static_cast<TreeBuilder*>(userdata);
    if (!b.error.empty()) return 1;
    b.pop_inline();
    return 0;
}

static int text_cb(MD_TEXTTYPE type, const MD_CHAR* text, MD_SIZE size, void* userdata) {
    TreeBuilder& b = *static_cast<TreeBuilder*>(userdata);
    if (!b.error.empty()) return 1;

    const std::string s(text ? text : "", static_cast<std::size_t>(size));

    Block* cur = b.current_block();
    if (cur && (cur->kind == BlockKind::CodeBlock || cur->kind == BlockKind::Html)) {
        if (type == MD_TEXT_ENTITY) cur->literal += decode_entity(s);
        else if (type == MD_TEXT_NULLCHAR) cur->literal += "\xEF\xBF\xBD";
        else cur->literal += s;
        return 0;
    }

    switch (type) {
        case MD_TEXT_NORMAL:
        case MD_TEXT_CODE:
            return b.append_text(InlineKind::Text, s) ? 0 : 1;
        case MD_TEXT_ENTITY:
            return b.append_text(InlineKind::Text, decode_entity(s)) ? 0 : 1;
        case MD_TEXT_NULLCHAR:
            return b.append_text(InlineKind::Text, "\xEF\xBF\xBD") ? 0 : 1;
        case MD_TEXT_SOFTBR:
            return b.append_text(InlineKind::SoftBreak, " ") ? 0 : 1;
        case MD_TEXT_BR:
            return b.append_text(InlineKind::HardBreak, "\n") ? 0 : 1;
        case MD_TEXT_HTML:
            return b.append_text(InlineKind::Other, s) ? 0 : 1;
        default:
            return b.append_text(InlineKind::Text, s) ? 0 : 1;
    }
}

Block parse_document(const std::string& source, const ParserLimits& limits) {
    if (source.size() > limits.max_input_bytes) {
        throw std::runtime_error("markdown input too large: " + std::to_string(source.size()) + " bytes");
    }

    TreeBuilder builder(limits);

    MD_PARSER parser;
    std::memset(&parser, 0, sizeof(parser));
    parser.abi_version = 0;
    parser.flags = MD_DIALECT_COMMONMARK;
    parser.enter_block = enter_block_cb;
    parser.leave_block = leave_block_cb;
    parser.enter_span = enter_span_cb;
    parser.leave_span = leave_span_cb;
    parser.text = text_cb;

    const int rc = md_parse(source.data(), static_cast<MD_SIZE>(source.size()), &parser, &builder);
    if (!builder.error.empty()) {
        throw std::runtime_error("markdown parse failed: " + builder.error);
    }
    if (rc != 0) {
        throw std::runtime_error("markdown parse failed (md4c returned " + std::to_string(rc) + ")");
    }

    return std::move(builder.root);
}

}  // namespace md
