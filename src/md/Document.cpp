#include "md/Document.hpp"

#include <string>
#include <vector>

namespace md {

static void flatten_into(std::string& out, const Inline& n) {
    switch (n.kind) {
        case InlineKind::Text:
        case InlineKind::Other:
            out += n.text;
            break;
        case InlineKind::SoftBreak:
            out += " ";
            break;
        case InlineKind::HardBreak:
            out += "\n";
            break;
        default:
            break;
    }
    for (const auto& c : n.children) flatten_into(out, c);
}

std::string flatten_text(const std::vector<Inline>& inlines) {
    std::string out;
    for (const auto& n : inlines) flatten_into(out, n);
    return out;
}

std::string flatten_text(const Inline& node) {
    std::string out;
    flatten_into(out, node);
    return out;
}

const std::vector<Inline>& item_inlines(const Block& item) {
    static const std::vector<Inline> kEmpty;

    if (!item.inlines.empty()) return item.inlines;
    for (const auto& c : item.children) {
        if (c.kind == BlockKind::Paragraph) return c.inlines;
    }
    return kEmpty;
}

int sole_emphasis_level(const Block& paragraph) {
    if (paragraph.kind != BlockKind::Paragraph) return 0;
    if (paragraph.inlines.size() != 1) return 0;
    const Inline& only = paragraph.inlines.front();
    if (only.kind != InlineKind::Emphasis) return 0;
    return only.level;
}

std::string escape_text(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        switch (c) {
            case '\\':
            case '*':
            case '_':
            case '[':
            case ']':
            case '`':
            case '&':
            case '<':
                out.push_back('\\');
                out.push_back(c);
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    return out;
}

std::string escape_line_start(const std::string& line) {
    if (line.empty()) return line;

    switch (line[0]) {
        case '#':
        case '>':
        case '+':
        case '-':
        case '=':
        case '~':
            return "\\" + line;
        default:
            break;
    }

    size_t i = 0;
    while (i < line.size() && i < 9 && line[i] >= '0' && line[i] <= '9') ++i;
    if (i > 0 && i < line.size() && (line[i] == '.' || line[i] == ')')) {
        return line.substr(0, i) + "\\" + line.substr(i);
    }
    return line;
}

std::string escape_heading_end(const std::string& content) {
    size_t end = content.size();
    while (end > 0 && content[end - 1] == ' ') --end;

    size_t run = end;
    while (run > 0 && content[run - 1] == '#') --run;
    if (run == end) return content;

    // a closing sequence needs a space before it, or nothing at all
    if (run > 0 && content[run - 1] != ' ' && content[run - 1] != '\t') return content;

    return content.substr(0, run) + "\\" + content.substr(run);
}

static std::string code_span(const std::string& code) {
    if (code.find('`') == std::string::npos) return "`" + code + "`";
    return "`` " + code + " ``";
}

static std::string link_destination(const std::string& dest) {
    if (dest.find(' ') != std::string::npos) return "<" + dest + ">";
    return dest;
}

// `line_start` is true while nothing has been written on the current line,
// so text there gets its block markers escaped.
static void inline_markdown_into(std::string& out, const Inline& n, bool& line_start) {
    switch (n.kind) {
        case InlineKind::Text:
            if (n.text.empty()) break;
            out += line_start ? escape_line_start(escape_text(n.text)) : escape_text(n.text);
            line_start = false;
            break;
        case InlineKind::Other:
            if (n.children.empty()) {
                out += n.text;
                if (!n.text.empty()) line_start = false;
            } else {
                for (const auto& c : n.children) inline_markdown_into(out, c, line_start);
            }
            break;
        case InlineKind::SoftBreak:
            out += "\n";
            line_start = true;
            break;
        case InlineKind::HardBreak:
            out += "\\\n";
            line_start = true;
            break;
        case InlineKind::Emphasis: {
            const std::string mark = (n.level >= 2) ? "**" : "*";
            out += mark;
            line_start = false;
            for (const auto& c : n.children) inline_markdown_into(out, c, line_start);
            out += mark;
            break;
        }
        case InlineKind::Link:
            out += "[";
            line_start = false;
            for (const auto& c : n.children) inline_markdown_into(out, c, line_start);
            out += "](" + link_destination(n.text) + ")";
            break;
        case InlineKind::Image:
            out += "![" + escape_text(flatten_text(n.children)) + "](" + link_destination(n.text) + ")";
            line_start = false;
            break;
        case InlineKind::CodeSpan:
            out += code_span(flatten_text(n.children));
            line_start = false;
            break;
    }
}

std::string inlines_to_markdown(const std::vector<Inline>& inlines) {
    std::string out;
    bool line_start = true;
    for (const auto& n : inlines) inline_markdown_into(out, n, line_start);
    return out;
}

static std::string indent_continuation(const std::string& text, const std::string& pad) {
    std::string out;
    out.reserve(text.size() + 16);
    for (size_t i = 0; i < text.size(); ++i) {
        out.push_back(text[i]);
        if (text[i] == '\n' && i + 1 < text.size() && text[i + 1] != '\n') out += pad;
    }
    return out;
}

static std::string prefix_lines(const std::string& text, const std::string& prefix) {
    std::string out = prefix;
    for (size_t i = 0; i < text.size(); ++i) {
        out.push_back(text[i]);
        if (text[i] == '\n') out += prefix;
    }
    return out;
}

static bool item_is_tight(const Block& item) {
    if (!item.inlines.empty()) return true;
    return item.children.size() <= 1;
}

static std::string list_item_body(const Block& item) {
    std::string body;
    if (!item.inlines.empty()) body = inlines_to_markdown(item.inlines);

    for (const auto& c : item.children) {
        if (!body.empty()) body += item.inlines.empty() ? "\n\n" : "\n";
        body += to_markdown(c);
    }
    return body;
}

std::string to_markdown(const Block& block) {
    switch (block.kind) {
        case BlockKind::Paragraph:
            return inlines_to_markdown(block.inlines);

        case BlockKind::Heading: {
            const int level = (block.heading_level < 1) ? 1 : (block.heading_level > 6 ? 6 : block.heading_level);
            return std::string(static_cast<size_t>(level), '#') + " " + escape_heading_end(inlines_to_markdown(block.inlines));
        }

        case BlockKind::ThematicBreak:
            return "---";

        case BlockKind::CodeBlock: {
            std::string out = "```" + block.info + "\n" + block.literal;
            if (block.literal.empty() || block.literal.back() != '\n') out += "\n";
            out += "```";
            return out;
        }

        case BlockKind::Html: {
            std::string out = block.literal;
            while (!out.empty() && out.back() == '\n') out.pop_back();
            return out;
        }

        case BlockKind::BlockQuote: {
            std::string inner;
            for (size_t i = 0; i < block.children.size(); ++i) {
                if (i) inner += "\n\n";
                inner += to_markdown(block.children[i]);
            }
            return prefix_lines(inner, "> ");
        }

        case BlockKind::List: {
            bool tight = true;
            for (const auto& item : block.children) {
                if (!item_is_tight(item)) tight = false;
            }

            std::string out;
            int number = block.list_start;
            for (size_t i = 0; i < block.children.size(); ++i) {
                if (i) out += tight ? "\n" : "\n\n";
                const std::string marker = block.ordered ? std::to_string(number++) + ". " : "- ";
                out += marker + indent_continuation(list_item_body(block.children[i]), std::string(marker.size(), ' '));
            }
            return out;
        }

        case BlockKind::ListItem:
            return list_item_body(block);

        case BlockKind::Document:
        case BlockKind::Other: {
            if (!block.inlines.empty()) return inlines_to_markdown(block.inlines);
            std::string out;
            for (size_t i = 0; i < block.children.size(); ++i) {
                if (i) out += "\n\n";
                out += to_markdown(block.children[i]);
            }
            return out;
        }
    }
    return std::string();
}

}  // namespace md
