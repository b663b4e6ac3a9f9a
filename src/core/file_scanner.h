#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "concurrency/blocking_queue.h"
#include "rule_resolver.h"

namespace core {

struct ScanOptions {
    std::size_t threads = 0;       // 0 = hardware concurrency
    bool follow_symlinks = false;  // off: symlinks are never part of the result
    ResolverOptions rules;
};

struct ScanStats {
    std::size_t files = 0;        // emitted regular files
    std::size_t directories = 0;  // directories listed
    std::size_t ignored = 0;      // entries rejected by ignore rules
    std::size_t skipped = 0;      // symlinks / special files / unreadable entries
    std::int64_t elapsed_ms = 0;
};

// Sorted component by component (std::filesystem::path ordering), no duplicates.
using FilteredPathList = std::vector<std::filesystem::path>;

// Blocks until the channel is closed, then sorts and deduplicates
// everything that was pushed into it.
FilteredPathList collect_paths(BlockingQueue<std::filesystem::path>& channel);

// Sort + dedup step of collect_paths, usable on any vector.
void sort_unique_paths(FilteredPathList& paths);

class FileScanner {
public:
    explicit FileScanner(ScanOptions cfg = {});

    // Walks root in parallel and returns the regular files that survive the
    // ignore rules. Paths keep root as their prefix (root "proj" yields
    // "proj/src/a.c"). An empty result means nothing to include.
    FilteredPathList scan(const std::filesystem::path& root, ScanStats* stats = nullptr) const;

private:
    ScanOptions cfg_;

    struct WalkContext;
    struct DirTask;

    void walk_directory_(WalkContext& ctx, DirTask task) const;
    void spawn_(WalkContext& ctx, DirTask task) const;
};

} // namespace core
