#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "file_scanner.h"

namespace core {

struct SnapshotOptions {
    bool parallel_reads = true;  // read file contents on a ThreadPool
    std::size_t threads = 0;     // 0 = hardware concurrency
};

// Full file contents as text. Fails (with a reason in *error) for missing
// or unreadable files, directories and content that is not valid UTF-8.
bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& error);

// Extension without the dot; empty for "Makefile" and for dotfiles like ".gitignore".
std::string language_tag(const std::filesystem::path& path);

// The path as shown in the document: relative to root, '/'-separated.
std::string display_path(const std::filesystem::path& root, const std::filesystem::path& path);

// Title, summary, file count, fenced tree, then one fenced block per path
// in list order. A file that cannot be read gets "Error reading file: ..."
// as its body instead of aborting the document.
std::string assemble_snapshot(const std::string& project_name,
                              const std::filesystem::path& root,
                              const FilteredPathList& paths,
                              const SnapshotOptions& opts = {});

// scan + assemble. std::nullopt when the scan found nothing to include.
std::optional<std::string> build_snapshot(const std::string& project_name,
                                          const std::filesystem::path& root,
                                          const ScanOptions& scan_opts,
                                          const SnapshotOptions& snap_opts = {},
                                          ScanStats* stats = nullptr);

// Name used in the title: last component of root, or root as given when it
// has none ("." / ".." / "/").
std::string project_name_for(const std::filesystem::path& root);

} // namespace core
