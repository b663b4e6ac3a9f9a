#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Outcome of evaluating a path against ignore rules.
enum class Match {
    None,       // no rule says anything
    Ignore,     // excluded
    Whitelist,  // re-included by a "!" rule
};

const char* match_name(Match m);

// One pattern line of an ignore file.
struct IgnoreRule {
    std::string text;             // original line, for diagnostics
    std::string glob;             // pattern without "!", leading '/' and trailing '/'
    bool negated = false;         // "!pattern"
    bool directory_only = false;  // "pattern/"
    bool anchored = false;        // matched against the whole relative path, not the basename
};

enum class ParseStatus {
    Rule,       // *rule is filled in
    Skip,       // blank line or comment
    Malformed,  // can never match
};

ParseStatus parse_ignore_line(std::string_view line, IgnoreRule* rule);

// Rules of one source (one .gitignore, the global excludes file, ...).
// Paths are matched relative to base_dir; inside a layer the last
// matching rule wins. Immutable once built, so shared freely across threads.
class IgnoreRuleLayer {
public:
    IgnoreRuleLayer() = default;

    // base_dir: absolute, generic ('/'-separated) form
    IgnoreRuleLayer(std::string base_dir, std::string source);

    // Reads an ignore file. Returns std::nullopt if it does not exist or
    // cannot be read. Malformed lines are dropped with a warning.
    static std::optional<IgnoreRuleLayer> load_file(const std::filesystem::path& file,
                                                    const std::string& base_dir);

    // Returns false (and keeps nothing) for malformed lines.
    bool add_line(std::string_view line);

    // abs_path: absolute generic path of the candidate.
    Match match(const std::string& abs_path, bool is_dir) const;

    const std::string& base_dir() const { return base_dir_; }
    const std::string& source() const { return source_; }
    const std::vector<IgnoreRule>& rules() const { return rules_; }
    bool empty() const { return rules_.empty(); }
    std::size_t malformed_lines() const { return malformed_; }

private:
    std::string base_dir_;
    std::string source_;
    std::vector<IgnoreRule> rules_;
    std::size_t malformed_ = 0;

    // abs_path relative to base_dir_, or nullopt if it lies outside
    std::optional<std::string_view> relative_(const std::string& abs_path) const;
};

// Generic-form absolute string for a path, without a trailing separator
// (except for the filesystem root itself).
std::string generic_abs_string(const std::filesystem::path& p);

// dir + "/" + name, without doubling the separator after "/".
std::string join_generic(const std::string& dir, const std::string& name);

} // namespace core
