#include "rule_resolver.h"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include "utils/logging.h"
#include "utils/text.h"

namespace core {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> getenv_nonempty(const char* key) {
    const char* v = std::getenv(key);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

// Value of core.excludesFile in one git config file, if set there.
std::optional<std::string> read_core_excludes_file(const fs::path& config_path) {
    std::ifstream in(config_path);
    if (!in.is_open()) return std::nullopt;

    std::optional<std::string> out;
    std::string section;
    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = utils::trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            auto close = line.find(']');
            if (close == std::string::npos) continue;
            section = utils::to_lower(utils::trim(line.substr(1, close - 1)));
            continue;
        }
        if (section != "core") continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        if (utils::to_lower(utils::trim(line.substr(0, eq))) != "excludesfile") continue;

        std::string val = utils::trim(line.substr(eq + 1));
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }
        if (!val.empty()) out = val;
    }
    return out;
}

} // namespace

IgnoreStack::IgnoreStack(IgnoreStackPtr parent, std::string label, std::vector<IgnoreRuleLayer> layers)
    : parent_(std::move(parent)), label_(std::move(label)), layers_(std::move(layers)) {}

Match IgnoreStack::match(const std::string& abs_path, bool is_dir) const {
    for (const IgnoreStack* node = this; node != nullptr; node = node->parent_.get()) {
        for (const auto& layer : node->layers_) {
            Match m = layer.match(abs_path, is_dir);
            if (m != Match::None) {
                LOG_TRACE(abs_path + ": " + match_name(m) + " by " + layer.source() +
                          " [" + node->label() + "]");
                return m;
            }
        }
    }
    return Match::None;
}

std::optional<fs::path> RuleSetResolver::global_excludes_path() {
    auto home = getenv_nonempty("HOME");
    auto xdg = getenv_nonempty("XDG_CONFIG_HOME");

    std::vector<fs::path> config_files;
    if (xdg) config_files.push_back(fs::path(*xdg) / "git" / "config");
    else if (home) config_files.push_back(fs::path(*home) / ".config" / "git" / "config");
    if (home) config_files.push_back(fs::path(*home) / ".gitconfig");

    std::optional<std::string> configured;
    for (const auto& cfg : config_files) {
        if (auto v = read_core_excludes_file(cfg)) configured = v;
    }

    if (configured) {
        if (utils::starts_with(*configured, "~/") && home) {
            return fs::path(*home) / configured->substr(2);
        }
        return fs::path(*configured);
    }

    if (xdg) return fs::path(*xdg) / "git" / "ignore";
    if (home) return fs::path(*home) / ".config" / "git" / "ignore";
    return std::nullopt;
}

std::optional<std::string> RuleSetResolver::find_repository_root(const std::string& abs_dir) {
    fs::path dir(abs_dir);
    while (true) {
        std::error_code ec;
        if (fs::exists(dir / kVcsDirName, ec)) {
            return generic_abs_string(dir);
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) break;
        dir = dir.parent_path();
    }
    return std::nullopt;
}

RuleSetResolver::RuleSetResolver(const fs::path& root, ResolverOptions opts)
    : opts_(opts), root_(generic_abs_string(root)) {
    repo_root_ = find_repository_root(root_);
    if (repo_root_) {
        LOG_DEBUG("Repository root: " + *repo_root_);
    }

    IgnoreStackPtr stack;

    if (opts_.global_ignore) {
        if (auto path = global_excludes_path()) {
            auto layer = IgnoreRuleLayer::load_file(*path, repo_root_.value_or(root_));
            if (layer && !layer->empty()) {
                stack = std::make_shared<IgnoreStack>(stack, "global",
                                                      std::vector<IgnoreRuleLayer>{std::move(*layer)});
            }
        }
    }

    if (opts_.git_exclude && repo_root_) {
        fs::path git_dir = fs::path(*repo_root_) / kVcsDirName;
        std::error_code ec;
        if (fs::is_directory(git_dir, ec)) {
            auto layer = IgnoreRuleLayer::load_file(git_dir / "info" / "exclude", *repo_root_);
            if (layer && !layer->empty()) {
                stack = std::make_shared<IgnoreStack>(stack, "exclude",
                                                      std::vector<IgnoreRuleLayer>{std::move(*layer)});
            }
        }
    }

    if (opts_.parent_ignores) {
        stack = push_parent_layers_(std::move(stack));
    }

    root_stack_ = descend(stack, root, root_);
}

IgnoreStackPtr RuleSetResolver::push_parent_layers_(IgnoreStackPtr stack) const {
    // Directories strictly above the root, up to the repository root when
    // there is one, else up to the filesystem root.
    std::vector<fs::path> ancestors;
    fs::path dir(root_);
    while (dir.has_parent_path() && dir.parent_path() != dir) {
        if (repo_root_ && generic_abs_string(dir) == *repo_root_) break;
        dir = dir.parent_path();
        ancestors.push_back(dir);
    }

    for (auto it = ancestors.rbegin(); it != ancestors.rend(); ++it) {
        std::string abs = generic_abs_string(*it);
        auto layers = load_dir_layers_(*it, abs);
        if (!layers.empty()) {
            stack = std::make_shared<IgnoreStack>(stack, abs, std::move(layers));
        }
    }
    return stack;
}

std::vector<IgnoreRuleLayer> RuleSetResolver::load_dir_layers_(const fs::path& dir,
                                                               const std::string& abs_dir) const {
    std::vector<IgnoreRuleLayer> layers;
    if (opts_.ignore_files) {
        if (auto layer = IgnoreRuleLayer::load_file(dir / kIgnoreName, abs_dir)) {
            if (!layer->empty()) layers.push_back(std::move(*layer));
        }
    }
    if (auto layer = IgnoreRuleLayer::load_file(dir / kGitIgnoreName, abs_dir)) {
        if (!layer->empty()) layers.push_back(std::move(*layer));
    }
    return layers;
}

IgnoreStackPtr RuleSetResolver::descend(const IgnoreStackPtr& parent,
                                        const fs::path& dir,
                                        const std::string& abs_dir) const {
    auto layers = load_dir_layers_(dir, abs_dir);
    if (layers.empty()) return parent;
    return std::make_shared<IgnoreStack>(parent, abs_dir, std::move(layers));
}

bool RuleSetResolver::is_vcs_metadata(const std::string& name, bool is_dir) {
    return is_dir && name == kVcsDirName;
}

Match RuleSetResolver::evaluate(const IgnoreStackPtr& stack,
                                const std::string& abs_path,
                                const std::string& name,
                                bool is_dir) const {
    if (is_vcs_metadata(name, is_dir)) return Match::Ignore;
    if (!stack) return Match::None;
    return stack->match(abs_path, is_dir);
}

} // namespace core
