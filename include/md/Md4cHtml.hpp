#pragma once

#include <string>

namespace md {

// Render CommonMark source to an HTML fragment with md4c-html.
// Output is XHTML-style (<hr />, <br />). Throws std::runtime_error on failure.
std::string markdown_to_html(const std::string& source);

}  // namespace md
