#include "snapshot.h"

#include <cerrno>
#include <fstream>
#include <future>
#include <iterator>
#include <system_error>

#include "concurrency/thread_pool.h"
#include "path_tree.h"
#include "utils/logging.h"
#include "utils/text.h"
#include "utils/time_utils.h"

namespace core {

namespace fs = std::filesystem;

namespace {

constexpr const char* kSummaryLine =
    "This file contains a snapshot of the project structure and source code, "
    "formatted for AI consumption.\n";

// "No such file or directory (os error 2)"
std::string os_error_text(int e) {
    return std::error_code(e, std::generic_category()).message() +
           " (os error " + std::to_string(e) + ")";
}

std::string block_body(const fs::path& path) {
    std::string text;
    std::string err;
    if (read_text_file(path, text, err)) return text;

    LOG_WARN("Cannot read " + path.string() + ": " + err);
    return "Error reading file: " + err;
}

std::vector<std::string> read_bodies(const FilteredPathList& paths, const SnapshotOptions& opts) {
    std::vector<std::string> bodies;
    bodies.reserve(paths.size());

    if (!opts.parallel_reads || paths.size() < 2) {
        for (const auto& p : paths) bodies.push_back(block_body(p));
        return bodies;
    }

    // Futures are held in list order, so completion order never leaks
    // into the document.
    ThreadPool pool(opts.threads);
    std::vector<std::future<std::string>> futs;
    futs.reserve(paths.size());
    for (const auto& p : paths) {
        futs.push_back(pool.submit(block_body, p));
    }
    for (auto& f : futs) {
        bodies.push_back(f.get());
    }
    pool.shutdown();
    return bodies;
}

} // namespace

bool read_text_file(const fs::path& path, std::string& out, std::string& error) {
    out.clear();

    std::error_code ec;
    fs::file_status st = fs::status(path, ec);
    if (ec) {
        error = os_error_text(ec.value());
        return false;
    }
    if (fs::is_directory(st)) {
        error = os_error_text(EISDIR);
        return false;
    }

    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        int e = errno;
        error = e != 0 ? os_error_text(e) : std::string("cannot open file");
        return false;
    }

    errno = 0;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        int e = errno;
        out.clear();
        error = e != 0 ? os_error_text(e) : std::string("read failed");
        return false;
    }

    if (!utils::is_valid_utf8(out)) {
        out.clear();
        error = "stream did not contain valid UTF-8";
        return false;
    }
    return true;
}

std::string language_tag(const fs::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    return ext;
}

std::string display_path(const fs::path& root, const fs::path& path) {
    return relative_to_root(root, path).generic_string();
}

std::string assemble_snapshot(const std::string& project_name,
                              const fs::path& root,
                              const FilteredPathList& paths,
                              const SnapshotOptions& opts) {
    utils::Stopwatch sw;

    std::string doc;
    doc += "# Project Snapshot: " + project_name + "\n\n";
    doc += kSummaryLine;
    doc += "Total files included: " + std::to_string(paths.size()) + "\n\n";

    auto tree = build_tree(root, paths);
    doc += "```\n" + render_tree(*tree) + "\n```\n\n";

    doc += "## File Contents\n\n";

    auto bodies = read_bodies(paths, opts);
    for (std::size_t i = 0; i < paths.size(); ++i) {
        doc += "```";
        doc += language_tag(paths[i]);
        doc += ":";
        doc += display_path(root, paths[i]);
        doc += "\n";
        doc += bodies[i];
        doc += "\n```\n\n";
    }

    LOG_INFO(
        "Snapshot assembled: files=" + std::to_string(paths.size()) +
        " bytes=" + std::to_string(doc.size()) +
        " t_ms=" + std::to_string(sw.elapsed_ms())
    );
    return doc;
}

std::optional<std::string> build_snapshot(const std::string& project_name,
                                          const fs::path& root,
                                          const ScanOptions& scan_opts,
                                          const SnapshotOptions& snap_opts,
                                          ScanStats* stats) {
    FileScanner scanner(scan_opts);
    auto paths = scanner.scan(root, stats);
    if (paths.empty()) {
        LOG_INFO("Nothing to include under " + root.string());
        return std::nullopt;
    }
    return assemble_snapshot(project_name, root, paths, snap_opts);
}

std::string project_name_for(const fs::path& root) {
    std::string s = root.string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();

    fs::path p(s);
    while (p.filename() == "." && p.has_parent_path()) p = p.parent_path();

    std::string name = p.filename().string();
    if (name.empty() || name == "." || name == "..") return root.string();
    return name;
}

} // namespace core
