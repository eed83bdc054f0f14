#include "md/Md4cHtml.hpp"

#include <md4c-html.h>

#include <stdexcept>
#include <string>

namespace md {

static void append_chunk(const MD_CHAR* data, MD_SIZE size, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(data, size);
}

std::string markdown_to_html(const std::string& source) {
    std::string html;
    html.reserve(source.size() + source.size() / 2);

    const unsigned parser_flags = MD_DIALECT_COMMONMARK;
    const unsigned renderer_flags = MD_HTML_FLAG_XHTML | MD_HTML_FLAG_SKIP_UTF8_BOM;
    const int rc = md_html(source.data(), static_cast<MD_SIZE>(source.size()), append_chunk, &html,
                           parser_flags, renderer_flags);
    if (rc != 0) {
        throw std::runtime_error("markdown to html failed (md4c returned " + std::to_string(rc) + ")");
    }
    return html;
}

}  // namespace md
