#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace core {

// File or Directory. Only directories have children; the map is unordered,
// so anything that prints children must sort the keys itself.
struct TreeNode {
    enum class Kind { File, Directory };

    explicit TreeNode(Kind k = Kind::Directory) : kind(k) {}

    Kind kind;
    std::unordered_map<std::string, std::unique_ptr<TreeNode>> children;

    bool is_dir() const { return kind == Kind::Directory; }

    // Names of the children in byte-wise order.
    std::vector<std::string> sorted_names() const;

    // Number of File leaves reachable from this node.
    std::size_t file_count() const;
};

// Splits rel into its name segments (root names and separators dropped)
// and inserts them below node: Directory nodes for all but the last,
// a File leaf for the last. Empty segment lists are a no-op.
void insert_path(TreeNode& node, const std::vector<std::string>& segments);

// path relative to root when it lies under root, else path unchanged.
std::filesystem::path relative_to_root(const std::filesystem::path& root,
                                       const std::filesystem::path& path);

std::vector<std::string> path_segments(const std::filesystem::path& rel);

// Folds a flat path list into a Directory tree rooted at root.
std::unique_ptr<TreeNode> build_tree(const std::filesystem::path& root,
                                     const std::vector<std::filesystem::path>& paths);

// ".\n" followed by one line per node, tree(1)-style connectors.
std::string render_tree(const TreeNode& root);

} // namespace core
