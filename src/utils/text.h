#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace utils {

// Strips spaces, tabs, CR and LF on both ends.
std::string trim(std::string_view s);

std::string to_lower(std::string s);
std::string to_upper(std::string s);

bool starts_with(std::string_view s, std::string_view prefix);

// "1/true/yes/y/on" and "0/false/no/n/off" (any case)
std::optional<bool> parse_bool(std::string_view s);

// Well-formed UTF-8: no overlongs, no surrogates, nothing above U+10FFFF.
bool is_valid_utf8(std::string_view s);

} // namespace utils
