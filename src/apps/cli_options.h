#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "core/file_scanner.h"
#include "core/snapshot.h"
#include "utils/config.h"

namespace apps {

extern const char* const kVersion;
extern const char* const kUsage;

// Anything left unset falls back to the config file / environment.
struct Args {
    std::string path = ".";
    std::optional<std::string> out;
    std::optional<std::size_t> threads;
    std::optional<bool> follow_symlinks;
    std::optional<bool> global_ignore;
    std::optional<bool> parent_ignores;
    std::optional<bool> git_exclude;
    std::optional<bool> ignore_files;
    std::string config_path = "dirsnap.env";
    std::optional<std::string> log_file;
    std::optional<std::string> log_level;

    bool help = false;
    bool version = false;
    std::string error;  // non-empty -> usage error
};

Args parse_args(int argc, char** argv);

struct Settings {
    core::ScanOptions scan;
    core::SnapshotOptions snap;
    std::string log_level;
    std::string log_file;
};

// Command line, then environment, then the config file, then defaults.
Settings resolve_settings(const Args& args, const utils::Config& cfg);

} // namespace apps
