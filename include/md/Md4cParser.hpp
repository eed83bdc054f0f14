#pragma once

#include <cstddef>
#include <string>

#include "md/Document.hpp"

namespace md {

struct ParserLimits {
    std::size_t max_input_bytes = 4 * 1024 * 1024;
    std::size_t max_nodes = 200000;
    int max_depth = 64;
};

// Parse CommonMark source with md4c into an owned block tree rooted at a
// Document block. Throws std::runtime_error if md4c fails or a limit is hit.
Block parse_document(const std::string& source, const ParserLimits& limits = ParserLimits{});

}  // namespace md
