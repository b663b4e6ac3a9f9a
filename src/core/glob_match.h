#pragma once

#include <string_view>

namespace core {

// gitignore-flavoured wildcard matching against a '/'-separated path:
//   *        any run of characters except '/'
//   ?        one character except '/'
//   [...]    character class: ranges, [!...] / [^...] negation, [:alpha:] etc.
//   \x       literal x
//   **       when it is a whole segment ("**/a", "a/**", "a/**/b"): any
//            number of directories; otherwise the same as '*'
bool glob_match(std::string_view pattern, std::string_view text);

// False for patterns that can never match: unterminated '[' class,
// unknown [:name:] class, or a dangling trailing backslash.
bool glob_is_valid(std::string_view pattern);

} // namespace core
