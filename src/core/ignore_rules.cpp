#include "ignore_rules.h"

#include <fstream>
#include <system_error>

#include "glob_match.h"
#include "utils/logging.h"

namespace core {

const char* match_name(Match m) {
    switch (m) {
        case Match::Ignore:    return "ignore";
        case Match::Whitelist: return "whitelist";
        default:               return "none";
    }
}

ParseStatus parse_ignore_line(std::string_view line, IgnoreRule* rule) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (line.empty() || line.front() == '#') return ParseStatus::Skip;

    std::string s(line);

    // Trailing spaces are dropped unless escaped with a backslash.
    while (!s.empty() && s.back() == ' ') {
        std::size_t k = s.size() - 1;
        std::size_t backslashes = 0;
        while (k > 0 && s[k - 1] == '\\') {
            ++backslashes;
            --k;
        }
        if (backslashes % 2 == 1) break;
        s.pop_back();
    }
    if (s.empty()) return ParseStatus::Skip;

    IgnoreRule r;
    r.text = std::string(line);

    if (s[0] == '!') {
        r.negated = true;
        s.erase(0, 1);
    } else if (s.size() > 1 && s[0] == '\\' && (s[1] == '!' || s[1] == '#')) {
        s.erase(0, 1);
    }

    if (!s.empty() && s.back() == '/') {
        r.directory_only = true;
        s.pop_back();
    }

    if (s.find('/') != std::string::npos) {
        r.anchored = true;
        if (s[0] == '/') s.erase(0, 1);
    }

    if (s.empty()) return ParseStatus::Skip;
    if (!glob_is_valid(s)) return ParseStatus::Malformed;

    r.glob = std::move(s);
    if (rule) *rule = std::move(r);
    return ParseStatus::Rule;
}

IgnoreRuleLayer::IgnoreRuleLayer(std::string base_dir, std::string source)
    : base_dir_(std::move(base_dir)), source_(std::move(source)) {}

std::optional<IgnoreRuleLayer> IgnoreRuleLayer::load_file(const std::filesystem::path& file,
                                                          const std::string& base_dir) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) return std::nullopt;

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        LOG_WARN("Ignore file unreadable, contributing no rules: " + file.generic_string());
        return std::nullopt;
    }

    IgnoreRuleLayer layer(base_dir, file.generic_string());

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line_no == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line.erase(0, 3);
        }
        if (!layer.add_line(line)) {
            LOG_WARN("Malformed ignore pattern skipped: " + file.generic_string() + ":" +
                     std::to_string(line_no) + ": " + line);
        }
    }

    if (in.bad()) {
        LOG_WARN("Ignore file read failed, contributing no rules: " + file.generic_string());
        return std::nullopt;
    }

    LOG_DEBUG("Loaded " + std::to_string(layer.rules().size()) + " ignore rules from " +
              file.generic_string());
    return layer;
}

bool IgnoreRuleLayer::add_line(std::string_view line) {
    IgnoreRule rule;
    switch (parse_ignore_line(line, &rule)) {
        case ParseStatus::Rule:
            rules_.push_back(std::move(rule));
            return true;
        case ParseStatus::Skip:
            return true;
        case ParseStatus::Malformed:
        default:
            ++malformed_;
            return false;
    }
}

std::optional<std::string_view> IgnoreRuleLayer::relative_(const std::string& abs_path) const {
    std::string_view p(abs_path);
    if (base_dir_ == "/") {
        if (p.size() < 2 || p[0] != '/') return std::nullopt;
        return p.substr(1);
    }
    if (p.size() <= base_dir_.size() + 1) return std::nullopt;
    if (p.compare(0, base_dir_.size(), base_dir_) != 0) return std::nullopt;
    if (p[base_dir_.size()] != '/') return std::nullopt;
    return p.substr(base_dir_.size() + 1);
}

Match IgnoreRuleLayer::match(const std::string& abs_path, bool is_dir) const {
    if (rules_.empty()) return Match::None;

    auto rel = relative_(abs_path);
    if (!rel.has_value()) return Match::None;

    std::string_view basename = *rel;
    auto slash = basename.rfind('/');
    if (slash != std::string_view::npos) basename.remove_prefix(slash + 1);

    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
        if (it->directory_only && !is_dir) continue;
        std::string_view subject = it->anchored ? *rel : basename;
        if (glob_match(it->glob, subject)) {
            return it->negated ? Match::Whitelist : Match::Ignore;
        }
    }
    return Match::None;
}

std::string generic_abs_string(const std::filesystem::path& p) {
    std::filesystem::path a = p;
    if (!a.is_absolute()) {
        std::error_code ec;
        auto abs = std::filesystem::absolute(p, ec);
        if (!ec) a = abs;
    }
    std::string s = a.lexically_normal().generic_string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

std::string join_generic(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

} // namespace core
