#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace utils {

// KEY=VALUE settings (dirsnap.env style):
// - empty lines and lines starting with # are skipped
// - an optional leading "export " is accepted
// - values can be unquoted or quoted ("...") / ('...');
//   unquoted values end at " #"
// - keys are case-insensitive
// - environment variables override file values if present
class Config {
public:
    // Returns false if the file can't be opened; settings already held are kept.
    bool load_file(const std::string& path);

    // Parses one line; returns false if it is neither blank, comment nor KEY=VALUE.
    bool parse_line(const std::string& line);

    void set(const std::string& key, const std::string& value);

    // env override -> file -> default
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    std::optional<std::string> get_string_opt(const std::string& key) const;

    int get_int(const std::string& key, int default_value) const;
    std::size_t get_size(const std::string& key, std::size_t default_value) const;
    bool get_bool(const std::string& key, bool default_value) const;

    bool has(const std::string& key) const;

private:
    std::unordered_map<std::string, std::string> kv_;

    static std::optional<std::string> getenv_(const std::string& key);
};

} // namespace utils
