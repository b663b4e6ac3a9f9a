#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ignore_rules.h"

namespace core {

struct ResolverOptions {
    bool global_ignore = true;   // core.excludesFile / ~/.config/git/ignore
    bool git_exclude = true;     // <repo>/.git/info/exclude
    bool parent_ignores = true;  // ignore files in directories above the root
    bool ignore_files = true;    // ".ignore" next to ".gitignore"
};

// One node per directory that carries ignore files, linked to the node of
// the nearest such ancestor. The bottom of the chain holds the global and
// repository exclude layers. Nodes never change after construction; worker
// tasks share them through IgnoreStackPtr.
class IgnoreStack;
using IgnoreStackPtr = std::shared_ptr<const IgnoreStack>;

class IgnoreStack {
public:
    // layers: highest precedence first
    IgnoreStack(IgnoreStackPtr parent, std::string label, std::vector<IgnoreRuleLayer> layers);

    // Walks from this node towards the bottom; the first layer with an
    // opinion decides.
    Match match(const std::string& abs_path, bool is_dir) const;

    const std::string& label() const { return label_; }

private:
    IgnoreStackPtr parent_;
    std::string label_;
    std::vector<IgnoreRuleLayer> layers_;
};

// Builds the ignore stack for one scan root and answers accept/reject for
// every candidate entry. Constructed per scan; holds no global state.
class RuleSetResolver {
public:
    static constexpr const char* kVcsDirName = ".git";
    static constexpr const char* kGitIgnoreName = ".gitignore";
    static constexpr const char* kIgnoreName = ".ignore";

    explicit RuleSetResolver(const std::filesystem::path& root, ResolverOptions opts = {});

    // Stack for the root directory: global, exclude, parent and root-local layers.
    const IgnoreStackPtr& root_stack() const { return root_stack_; }

    // Stack for dir, a directory below the root. Returns parent unchanged
    // when dir has no ignore files of its own.
    IgnoreStackPtr descend(const IgnoreStackPtr& parent,
                           const std::filesystem::path& dir,
                           const std::string& abs_dir) const;

    // The .git override is checked first and cannot be negated.
    Match evaluate(const IgnoreStackPtr& stack,
                   const std::string& abs_path,
                   const std::string& name,
                   bool is_dir) const;

    static bool is_vcs_metadata(const std::string& name, bool is_dir);

    const std::string& root() const { return root_; }
    const std::optional<std::string>& repository_root() const { return repo_root_; }

    // Location of the user's global excludes file, whether or not it exists.
    static std::optional<std::filesystem::path> global_excludes_path();

    // Nearest directory at or above dir that contains a ".git" entry.
    static std::optional<std::string> find_repository_root(const std::string& abs_dir);

private:
    ResolverOptions opts_;
    std::string root_;
    std::optional<std::string> repo_root_;
    IgnoreStackPtr root_stack_;

    std::vector<IgnoreRuleLayer> load_dir_layers_(const std::filesystem::path& dir,
                                                  const std::string& abs_dir) const;
    IgnoreStackPtr push_parent_layers_(IgnoreStackPtr stack) const;
};

} // namespace core
