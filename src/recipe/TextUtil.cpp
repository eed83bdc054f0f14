#include "recipe/TextUtil.hpp"

#include <cctype>

namespace textutil {

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

bool is_ascii_digit(char32_t c) {
    return c >= U'0' && c <= U'9';
}

char32_t next_codepoint(const std::string& s, std::size_t& i) {
    const unsigned char b0 = static_cast<unsigned char>(s[i]);

    size_t len = 0;
    char32_t cp = 0;
    if (b0 < 0x80) {
        ++i;
        return b0;
    } else if ((b0 & 0xE0) == 0xC0) {
        len = 2;
        cp = b0 & 0x1F;
    } else if ((b0 & 0xF0) == 0xE0) {
        len = 3;
        cp = b0 & 0x0F;
    } else if ((b0 & 0xF8) == 0xF0) {
        len = 4;
        cp = b0 & 0x07;
    } else {
        ++i;
        return 0xFFFD;
    }

    if (i + len > s.size()) {
        ++i;
        return 0xFFFD;
    }
    for (size_t k = 1; k < len; ++k) {
        const unsigned char b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) {
            ++i;
            return 0xFFFD;
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    i += len;
    return cp;
}

std::string truncate_utf8(const std::string& s, std::size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    std::size_t end = 0;
    std::size_t i = 0;
    while (i < s.size()) {
        next_codepoint(s, i);
        if (i > max_bytes) break;
        end = i;
    }
    return s.substr(0, end);
}

std::vector<std::string> split_commas(const std::string& text) {
    // decode once so the neighbour check looks at whole characters, not bytes
    std::vector<char32_t> cps;
    std::vector<size_t> starts;
    cps.reserve(text.size());
    starts.reserve(text.size() + 1);

    size_t i = 0;
    while (i < text.size()) {
        starts.push_back(i);
        cps.push_back(next_codepoint(text, i));
    }
    starts.push_back(text.size());

    std::vector<std::string> out;
    size_t seg_begin = 0;

    auto flush = [&](size_t seg_end) {
        std::string seg = trim(text.substr(seg_begin, seg_end - seg_begin));
        if (!seg.empty()) out.push_back(std::move(seg));
    };

    for (size_t k = 0; k < cps.size(); ++k) {
        if (cps[k] != U',') continue;

        const bool digit_before = k > 0 && is_ascii_digit(cps[k - 1]);
        const bool digit_after = k + 1 < cps.size() && is_ascii_digit(cps[k + 1]);
        if (digit_before && digit_after) continue;  // decimal comma

        flush(starts[k]);
        seg_begin = starts[k + 1];
    }
    flush(text.size());

    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

}
