#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace textutil {

// strip ASCII whitespace at both ends
std::string trim(const std::string& s);

bool is_ascii_digit(char32_t c);

// Decode the UTF-8 codepoint starting at s[i] and advance i past it.
// Invalid bytes decode as U+FFFD and advance by one.
char32_t next_codepoint(const std::string& s, std::size_t& i);

// Longest prefix of at most max_bytes bytes that does not cut a codepoint.
std::string truncate_utf8(const std::string& s, std::size_t max_bytes);

// Split on commas, except commas sitting between two ASCII digits ("1,5").
// Segments are trimmed, empty ones dropped. Used for both tags and yields.
std::vector<std::string> split_commas(const std::string& text);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

}
