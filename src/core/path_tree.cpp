#include "path_tree.h"

#include <algorithm>

namespace core {

namespace fs = std::filesystem;

namespace {

constexpr const char* kBranch     = "\xE2\x94\x9C\xE2\x94\x80\xE2\x94\x80 ";  // "├── "
constexpr const char* kLastBranch = "\xE2\x94\x94\xE2\x94\x80\xE2\x94\x80 ";  // "└── "
constexpr const char* kPipe       = "\xE2\x94\x82   ";                          // "│   "
constexpr const char* kBlank      = "    ";

void render_children(const TreeNode& node, const std::string& prefix, std::string& out) {
    const auto names = node.sorted_names();
    for (std::size_t i = 0; i < names.size(); ++i) {
        const bool last = (i + 1 == names.size());

        out += prefix;
        out += last ? kLastBranch : kBranch;
        out += names[i];
        out += '\n';

        const TreeNode& child = *node.children.at(names[i]);
        if (child.is_dir()) {
            render_children(child, prefix + (last ? kBlank : kPipe), out);
        }
    }
}

} // namespace

std::vector<std::string> TreeNode::sorted_names() const {
    std::vector<std::string> names;
    names.reserve(children.size());
    for (const auto& kv : children) names.push_back(kv.first);
    std::sort(names.begin(), names.end());
    return names;
}

std::size_t TreeNode::file_count() const {
    if (!is_dir()) return 1;
    std::size_t n = 0;
    for (const auto& kv : children) n += kv.second->file_count();
    return n;
}

void insert_path(TreeNode& node, const std::vector<std::string>& segments) {
    if (segments.empty() || !node.is_dir()) return;

    TreeNode* cur = &node;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        auto& slot = cur->children[segments[i]];
        if (!slot) slot = std::make_unique<TreeNode>(TreeNode::Kind::Directory);
        // a file sitting where a directory is needed: nothing below it can be placed
        if (!slot->is_dir()) return;
        cur = slot.get();
    }
    cur->children[segments.back()] = std::make_unique<TreeNode>(TreeNode::Kind::File);
}

fs::path relative_to_root(const fs::path& root, const fs::path& path) {
    const fs::path r = root.lexically_normal();
    const fs::path p = path.lexically_normal();

    auto ri = r.begin();
    auto pi = p.begin();
    for (; ri != r.end(); ++ri) {
        // "root/" normalizes with an empty trailing element, "./" to "."
        if (ri->empty() || *ri == ".") continue;
        if (pi == p.end() || *pi != *ri) return path;
        ++pi;
    }

    fs::path rel;
    for (; pi != p.end(); ++pi) rel /= *pi;
    return rel;
}

std::vector<std::string> path_segments(const fs::path& rel) {
    std::vector<std::string> segs;
    for (const auto& part : rel.relative_path()) {
        std::string s = part.string();
        if (s.empty() || s == ".") continue;
        segs.push_back(std::move(s));
    }
    return segs;
}

std::unique_ptr<TreeNode> build_tree(const fs::path& root, const std::vector<fs::path>& paths) {
    auto tree = std::make_unique<TreeNode>(TreeNode::Kind::Directory);
    for (const auto& p : paths) {
        insert_path(*tree, path_segments(relative_to_root(root, p)));
    }
    return tree;
}

std::string render_tree(const TreeNode& root) {
    std::string out = ".\n";
    render_children(root, "", out);
    return out;
}

} // namespace core
