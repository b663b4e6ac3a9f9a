#include "glob_match.h"

#include <cctype>
#include <cstddef>

namespace core {

namespace {

enum class ClassResult { Match, NoMatch, Malformed };

bool named_class_matches(std::string_view name, unsigned char c, bool& known) {
    known = true;
    if (name == "alnum")  return std::isalnum(c) != 0;
    if (name == "alpha")  return std::isalpha(c) != 0;
    if (name == "blank")  return c == ' ' || c == '\t';
    if (name == "cntrl")  return std::iscntrl(c) != 0;
    if (name == "digit")  return std::isdigit(c) != 0;
    if (name == "graph")  return std::isgraph(c) != 0;
    if (name == "lower")  return std::islower(c) != 0;
    if (name == "print")  return std::isprint(c) != 0;
    if (name == "punct")  return std::ispunct(c) != 0;
    if (name == "space")  return std::isspace(c) != 0;
    if (name == "upper")  return std::isupper(c) != 0;
    if (name == "xdigit") return std::isxdigit(c) != 0;
    known = false;
    return false;
}

// pat[p] == '['. On success *end is the index just past the closing ']'.
ClassResult match_class(std::string_view pat, std::size_t p, unsigned char ch, std::size_t* end) {
    const std::size_t n = pat.size();
    std::size_t i = p + 1;

    bool negate = false;
    if (i < n && (pat[i] == '!' || pat[i] == '^')) {
        negate = true;
        ++i;
    }

    bool matched = false;
    bool first = true;
    while (true) {
        if (i >= n) return ClassResult::Malformed;
        char c = pat[i];
        if (c == ']' && !first) {
            ++i;
            break;
        }
        first = false;

        if (c == '[' && i + 1 < n && pat[i + 1] == ':') {
            std::size_t close = pat.find(":]", i + 2);
            if (close == std::string_view::npos) return ClassResult::Malformed;
            bool known = false;
            if (named_class_matches(pat.substr(i + 2, close - (i + 2)), ch, known)) matched = true;
            if (!known) return ClassResult::Malformed;
            i = close + 2;
            continue;
        }

        unsigned char lo = (unsigned char)c;
        if (c == '\\') {
            if (++i >= n) return ClassResult::Malformed;
            lo = (unsigned char)pat[i];
        }
        ++i;

        if (i + 1 < n && pat[i] == '-' && pat[i + 1] != ']') {
            ++i;
            unsigned char hi = (unsigned char)pat[i];
            if (hi == '\\') {
                if (++i >= n) return ClassResult::Malformed;
                hi = (unsigned char)pat[i];
            }
            ++i;
            if (lo <= ch && ch <= hi) matched = true;
        } else if (ch == lo) {
            matched = true;
        }
    }

    *end = i;
    if (ch == '/') return ClassResult::NoMatch;
    return (matched != negate) ? ClassResult::Match : ClassResult::NoMatch;
}

bool match_from(std::string_view pat, std::size_t p, std::string_view text, std::size_t t) {
    const std::size_t n = pat.size();
    const std::size_t tn = text.size();

    while (p < n) {
        char c = pat[p];

        if (c == '*') {
            std::size_t q = p;
            while (q < n && pat[q] == '*') ++q;

            bool globstar = false;
            if (q - p >= 2) {
                bool seg_start = (p == 0 || pat[p - 1] == '/');
                bool seg_end = (q == n || pat[q] == '/');
                globstar = seg_start && seg_end;
            }

            if (globstar) {
                // "a/**" matches everything below a/
                if (q == n) return true;

                // "**/" spans zero or more whole directories
                std::size_t rest = q + 1;
                if (match_from(pat, rest, text, t)) return true;
                for (std::size_t i = t; i < tn; ++i) {
                    if (text[i] == '/' && match_from(pat, rest, text, i + 1)) return true;
                }
                return false;
            }

            if (q == n) return text.find('/', t) == std::string_view::npos;
            for (std::size_t i = t; ; ++i) {
                if (match_from(pat, q, text, i)) return true;
                if (i >= tn || text[i] == '/') break;
            }
            return false;
        }

        if (t >= tn) return false;
        unsigned char ch = (unsigned char)text[t];

        if (c == '?') {
            if (ch == '/') return false;
            ++p;
            ++t;
            continue;
        }

        if (c == '[') {
            std::size_t end = 0;
            if (match_class(pat, p, ch, &end) != ClassResult::Match) return false;
            p = end;
            ++t;
            continue;
        }

        if (c == '\\') {
            if (++p >= n) return false;
            c = pat[p];
        }
        if ((unsigned char)c != ch) return false;
        ++p;
        ++t;
    }

    return t == tn;
}

} // namespace

bool glob_match(std::string_view pattern, std::string_view text) {
    return match_from(pattern, 0, text, 0);
}

bool glob_is_valid(std::string_view pattern) {
    const std::size_t n = pattern.size();
    for (std::size_t i = 0; i < n; ++i) {
        if (pattern[i] == '\\') {
            if (i + 1 >= n) return false;
            ++i;
        } else if (pattern[i] == '[') {
            std::size_t end = 0;
            if (match_class(pattern, i, 'a', &end) == ClassResult::Malformed) return false;
            i = end - 1;
        }
    }
    return true;
}

} // namespace core
