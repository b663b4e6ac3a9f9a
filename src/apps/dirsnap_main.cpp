#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

#include "apps/cli_options.h"
#include "core/snapshot.h"
#include "utils/config.h"
#include "utils/logging.h"

namespace {

bool write_output(const std::string& path, const std::string& content, std::string& error) {
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        int e = errno;
        error = e != 0 ? std::error_code(e, std::generic_category()).message()
                       : std::string("cannot open file");
        return false;
    }
    out.write(content.data(), (std::streamsize)content.size());
    out.flush();
    if (!out) {
        error = "write failed";
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    using apps::kUsage;

    auto args = apps::parse_args(argc, argv);
    if (!args.error.empty()) {
        std::cerr << "dirsnap: " << args.error << "\n\n" << kUsage;
        return 2;
    }
    if (args.help) {
        std::cout << kUsage;
        return 0;
    }
    if (args.version) {
        std::cout << apps::kVersion << "\n";
        return 0;
    }

    utils::Config cfg;
    cfg.load_file(args.config_path);

    const apps::Settings settings = apps::resolve_settings(args, cfg);
    const core::ScanOptions& scan = settings.scan;
    const core::SnapshotOptions& snap = settings.snap;

    auto& log = utils::Logger::instance();
    {
        auto parsed = utils::parse_log_level(settings.log_level);
        if (!parsed) {
            std::cerr << "dirsnap: unknown log level '" << settings.log_level << "', using warn\n";
        }
        log.set_level(parsed.value_or(utils::LogLevel::Warn));

        const std::string& lf = settings.log_file;
        if (!lf.empty() && !log.set_log_file(lf)) {
            std::cerr << "Failed to open log file: " << lf << "\n";
        }
    }

    const std::filesystem::path root(args.path);
    std::error_code ec;
    const std::filesystem::path abs_root = std::filesystem::absolute(root, ec);
    if (ec) {
        std::cerr << "dirsnap: cannot resolve " << args.path << ": " << ec.message() << "\n";
        return 1;
    }

    LOG_DEBUG(
        "Options: root=" + abs_root.string() +
        " threads=" + std::to_string(scan.threads) +
        " follow_symlinks=" + std::string(scan.follow_symlinks ? "true" : "false") +
        " parallel_reads=" + std::string(snap.parallel_reads ? "true" : "false")
    );

    const std::string project_name = core::project_name_for(root);
    auto doc = core::build_snapshot(project_name, root, scan, snap);
    if (!doc) {
        std::cerr << "No files to include in the snapshot. Exiting.\n";
        return 0;
    }

    if (args.out) {
        std::string err;
        if (!write_output(*args.out, *doc, err)) {
            std::cerr << "Failed to write to output file " << *args.out << ": " << err << "\n";
            return 1;
        }
        std::cerr << "Snapshot successfully written to: " << *args.out << "\n";
    } else {
        std::cout << *doc << "\n";
        std::cout.flush();
        if (!std::cout) {
            std::cerr << "Failed to write snapshot to stdout\n";
            return 1;
        }
    }
    return 0;
}
