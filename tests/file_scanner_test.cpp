#include "core/file_scanner.h"

#include <algorithm>

#include "utils/logging.h"

#include "test_helpers.h"

using core::FileScanner;
using core::FilteredPathList;
using core::ScanOptions;
using core::ScanStats;

namespace {

// Ignore files outside the test tree must not leak into the result.
ScanOptions hermetic(std::size_t threads = 4) {
    ScanOptions o;
    o.threads = threads;
    o.rules.global_ignore = false;
    o.rules.parent_ignores = false;
    return o;
}

bool is_sorted_unique(const FilteredPathList& paths) {
    for (std::size_t i = 1; i < paths.size(); ++i) {
        if (!(paths[i - 1] < paths[i])) return false;
    }
    return true;
}

} // namespace

static int test_gitignore_dir_and_glob() {
    int failures = 0;
    TempDir tmp("scan_basic");
    const fs::path& root = tmp.path();
    write_file(root / "src" / "main.rs", "fn main() {}");
    write_file(root / "README.md", "# Test");
    write_file(root / "data" / "logs" / "error.log", "error!");
    write_file(root / "config.toml", "[config]");
    write_file(root / ".gitignore", "data/\n*.toml");

    ScanStats stats;
    auto paths = FileScanner(hermetic()).scan(root, &stats);

    EXPECT_EQ(join_lines(paths, root), std::string(".gitignore\nREADME.md\nsrc/main.rs\n"));
    EXPECT(paths.empty() || paths.front() == root / ".gitignore");
    EXPECT_EQ(stats.files, (std::size_t)3);
    EXPECT_EQ(stats.directories, (std::size_t)2);
    EXPECT_EQ(stats.ignored, (std::size_t)2);
    return failures;
}

static int test_git_dir_always_excluded() {
    int failures = 0;
    TempDir tmp("scan_git");
    const fs::path& root = tmp.path();
    write_file(root / ".git" / "HEAD", "ref: refs/heads/main\n");
    write_file(root / ".git" / "objects" / "ab" / "cdef", "blob");
    write_file(root / "sub" / ".git" / "config", "[core]\n");
    write_file(root / "sub" / "lib.c", "int x;\n");
    write_file(root / ".gitignore", "!.git\n!.git/\n");
    write_file(root / ".github" / "ci.yml", "on: push\n");

    auto paths = FileScanner(hermetic()).scan(root);
    EXPECT_EQ(join_lines(paths, root), std::string(".github/ci.yml\n.gitignore\nsub/lib.c\n"));
    return failures;
}

static int test_order_independent_of_threads() {
    int failures = 0;
    TempDir tmp("scan_order");
    const fs::path& root = tmp.path();
    for (int d = 0; d < 24; ++d) {
        fs::path dir = root / ("dir" + std::to_string(d)) / ("nested" + std::to_string(d % 3));
        for (int f = 0; f < 6; ++f) {
            write_file(dir / ("file" + std::to_string(f) + ".txt"), "x");
        }
        write_file(root / ("dir" + std::to_string(d)) / "top.md", "t");
    }
    write_file(root / ".gitignore", "file5.txt\n");

    auto one = FileScanner(hermetic(1)).scan(root);
    auto many = FileScanner(hermetic(8)).scan(root);
    auto again = FileScanner(hermetic(8)).scan(root);

    EXPECT_EQ(one.size(), (std::size_t)(24 * 6 + 1));
    EXPECT(one == many);
    EXPECT(many == again);
    EXPECT(is_sorted_unique(many));
    return failures;
}

static int test_empty_results() {
    int failures = 0;
    TempDir tmp("scan_empty");

    EXPECT(FileScanner(hermetic()).scan(tmp.path()).empty());

    // only directories
    fs::create_directories(tmp.path() / "a" / "b" / "c");
    EXPECT(FileScanner(hermetic()).scan(tmp.path()).empty());

    // everything ignored, the ignore file included
    write_file(tmp.path() / "a" / "x.txt", "x");
    write_file(tmp.path() / ".gitignore", "*\n");
    EXPECT(FileScanner(hermetic()).scan(tmp.path()).empty());

    EXPECT(FileScanner(hermetic()).scan(tmp.path() / "does-not-exist").empty());
    return failures;
}

static int test_file_root() {
    int failures = 0;
    TempDir tmp("scan_file_root");
    const fs::path file = tmp.path() / "only.txt";
    write_file(file, "hi");

    auto paths = FileScanner(hermetic()).scan(file);
    EXPECT_EQ(paths.size(), (std::size_t)1);
    EXPECT(!paths.empty() && paths.front() == file);
    return failures;
}

static int test_relative_root_keeps_prefix() {
    int failures = 0;
    TempDir tmp("scan_relative");
    write_file(tmp.path() / "proj" / "a.c", "a");

    const fs::path saved = fs::current_path();
    fs::current_path(tmp.path());
    auto paths = FileScanner(hermetic()).scan("proj");
    fs::current_path(saved);

    EXPECT_EQ(paths.size(), (std::size_t)1);
    EXPECT(!paths.empty() && paths.front().generic_string() == "proj/a.c");
    return failures;
}

static int test_symlinks() {
    int failures = 0;
    TempDir tmp("scan_symlinks");
    const fs::path& root = tmp.path();
    write_file(root / "target.txt", "t");
    write_file(root / "real" / "a.txt", "a");
    fs::create_symlink(root / "target.txt", root / "link.txt");
    fs::create_directory_symlink(root / "real", root / "linkdir");
    fs::create_directory_symlink(root / "real", root / "real" / "loop");
    fs::create_symlink(root / "nowhere", root / "broken");

    auto plain = FileScanner(hermetic()).scan(root);
    EXPECT_EQ(join_lines(plain, root), std::string("real/a.txt\ntarget.txt\n"));

    ScanOptions follow = hermetic();
    follow.follow_symlinks = true;
    auto followed = FileScanner(follow).scan(root);
    EXPECT_EQ(join_lines(followed, root),
              std::string("link.txt\nlinkdir/a.txt\nreal/a.txt\ntarget.txt\n"));
    return failures;
}

static int test_sibling_prefix_order() {
    int failures = 0;
    TempDir tmp("scan_prefix");
    const fs::path& root = tmp.path();
    write_file(root / "src" / "main.rs", "m");
    write_file(root / "src-old" / "a.rs", "o");
    write_file(root / "a.b", "b");
    write_file(root / "a" / "z.txt", "z");
    write_file(root / "lib+x" / "k.c", "k");
    write_file(root / "lib" / "k.c", "k");

    auto paths = FileScanner(hermetic()).scan(root);
    EXPECT_EQ(join_lines(paths, root),
              std::string("a/z.txt\na.b\nlib/k.c\nlib+x/k.c\nsrc/main.rs\nsrc-old/a.rs\n"));
    EXPECT(std::is_sorted(paths.begin(), paths.end()));
    return failures;
}

static int test_collect_paths() {
    int failures = 0;
    BlockingQueue<fs::path> channel;
    channel.push("b/x");
    channel.push("a");
    channel.push("b/x");
    channel.push("a.b");
    channel.push("a/z");
    channel.close();

    auto paths = core::collect_paths(channel);
    std::vector<std::string> got;
    for (const auto& p : paths) got.push_back(p.generic_string());

    // per component: "a" and everything below it before "a.b"
    std::vector<std::string> want{"a", "a/z", "a.b", "b/x"};
    EXPECT(got == want);
    return failures;
}

int main() {
    utils::Logger::instance().set_stream(nullptr);

    int failures = 0;
    try {
        failures += test_gitignore_dir_and_glob();
        failures += test_git_dir_always_excluded();
        failures += test_order_independent_of_threads();
        failures += test_empty_results();
        failures += test_file_root();
        failures += test_relative_root_keeps_prefix();
        failures += test_symlinks();
        failures += test_sibling_prefix_order();
        failures += test_collect_paths();
    } catch (const std::exception& e) {
        std::cerr << "exception: " << e.what() << "\n";
        return 1;
    }

    if (failures != 0) {
        std::cerr << "file_scanner: " << failures << " failure(s)\n";
        return 1;
    }
    std::cout << "file_scanner OK\n";
    return 0;
}
