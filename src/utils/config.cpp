#include "config.h"

#include "text.h"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace utils {

std::optional<std::string> Config::getenv_(const std::string& key) {
    const char* v = std::getenv(key.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;

    std::string line;
    while (std::getline(in, line)) {
        parse_line(line);
    }
    return true;
}

bool Config::parse_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return true;

    if (starts_with(line, "export ")) {
        line = trim(line.substr(7));
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) return false;

    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));
    if (key.empty()) return false;

    if (!val.empty() && (val.front() == '"' || val.front() == '\'')) {
        auto close = val.find(val.front(), 1);
        if (close == std::string::npos) return false;
        val = val.substr(1, close - 1);
    } else {
        auto hash = val.find(" #");
        if (hash != std::string::npos) val = trim(val.substr(0, hash));
    }

    kv_[to_upper(key)] = val;
    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    kv_[to_upper(key)] = value;
}

bool Config::has(const std::string& key) const {
    return get_string_opt(key).has_value();
}

std::optional<std::string> Config::get_string_opt(const std::string& key) const {
    auto k = to_upper(key);

    if (auto env = getenv_(k); env.has_value()) {
        return env;
    }
    auto it = kv_.find(k);
    if (it == kv_.end()) return std::nullopt;
    return it->second;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto opt = get_string_opt(key);
    return opt.has_value() ? *opt : default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto s = get_string_opt(key);
    if (!s.has_value()) return default_value;
    try {
        return std::stoi(*s);
    } catch (const std::logic_error&) {
        return default_value;
    }
}

std::size_t Config::get_size(const std::string& key, std::size_t default_value) const {
    int v = get_int(key, -1);
    if (v < 0) return default_value;
    return (std::size_t)v;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto s = get_string_opt(key);
    if (!s.has_value()) return default_value;
    return parse_bool(*s).value_or(default_value);
}

} // namespace utils
