#include "core/snapshot.h"

#include "utils/logging.h"

#include "test_helpers.h"

using core::ScanOptions;
using core::SnapshotOptions;

namespace {

ScanOptions hermetic() {
    ScanOptions o;
    o.threads = 4;
    o.rules.global_ignore = false;
    o.rules.parent_ignores = false;
    return o;
}

const char* kHeader =
    "This file contains a snapshot of the project structure and source code, "
    "formatted for AI consumption.\n";

bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

} // namespace

static int test_end_to_end_document() {
    int failures = 0;
    TempDir tmp("snapshot_doc");
    const fs::path& root = tmp.path();
    write_file(root / "src" / "main.ext", "X");
    write_file(root / "Cargo.toml", "[package]");
    write_file(root / "src" / "module" / "api.ext", "Y");
    write_file(root / ".gitignore", "");

    auto doc = core::build_snapshot("demo", root, hermetic());
    EXPECT(doc.has_value());
    if (!doc) return failures;

    const std::string expected =
        std::string("# Project Snapshot: demo\n\n") +
        kHeader +
        "Total files included: 4\n\n"
        "```\n"
        ".\n"
        "├── .gitignore\n"
        "├── Cargo.toml\n"
        "└── src\n"
        "    ├── main.ext\n"
        "    └── module\n"
        "        └── api.ext\n"
        "\n```\n\n"
        "## File Contents\n\n"
        "```:.gitignore\n\n```\n\n"
        "```toml:Cargo.toml\n[package]\n```\n\n"
        "```ext:src/main.ext\nX\n```\n\n"
        "```ext:src/module/api.ext\nY\n```\n\n";
    EXPECT_EQ(*doc, expected);
    return failures;
}

static int test_blocks_follow_tree_order() {
    int failures = 0;
    TempDir tmp("snapshot_order");
    const fs::path& root = tmp.path();
    write_file(root / "src" / "main.rs", "m");
    write_file(root / "src-old" / "a.rs", "o");
    write_file(root / "a.b", "b");
    write_file(root / "a" / "z.txt", "z");

    auto doc = core::build_snapshot("order", root, hermetic());
    EXPECT(doc.has_value());
    if (!doc) return failures;

    const std::string tree =
        "```\n"
        ".\n"
        "├── a\n"
        "│   └── z.txt\n"
        "├── a.b\n"
        "├── src\n"
        "│   └── main.rs\n"
        "└── src-old\n"
        "    └── a.rs\n"
        "\n```\n\n";
    EXPECT(contains(*doc, tree));

    const std::string blocks =
        "## File Contents\n\n"
        "```txt:a/z.txt\nz\n```\n\n"
        "```b:a.b\nb\n```\n\n"
        "```rs:src/main.rs\nm\n```\n\n"
        "```rs:src-old/a.rs\no\n```\n\n";
    EXPECT(contains(*doc, blocks));
    return failures;
}

static int test_unreadable_files_keep_their_block() {
    int failures = 0;
    TempDir tmp("snapshot_errors");
    const fs::path& root = tmp.path();
    write_file(root / "a.txt", "first");
    write_file(root / "b.txt", "gone soon");
    write_file(root / "c.bin", std::string("\xff\xfe\x00", 3));
    write_file(root / "d.txt", "last");
    fs::create_directories(root / "e.dir");

    core::FilteredPathList paths{
        root / "a.txt", root / "b.txt", root / "c.bin", root / "d.txt", root / "e.dir",
    };
    fs::remove(root / "b.txt");

    for (bool parallel : {false, true}) {
        SnapshotOptions so;
        so.parallel_reads = parallel;
        so.threads = 3;
        const std::string doc = core::assemble_snapshot("errs", root, paths, so);

        EXPECT(contains(doc, "Total files included: 5\n"));
        EXPECT(contains(doc, "```txt:a.txt\nfirst\n```\n\n"
                             "```txt:b.txt\nError reading file: No such file or directory (os error 2)\n```\n\n"));
        EXPECT(contains(doc, "```bin:c.bin\nError reading file: stream did not contain valid UTF-8\n```\n\n"));
        EXPECT(contains(doc, "```txt:d.txt\nlast\n```\n\n"));
        EXPECT(contains(doc, "```dir:e.dir\nError reading file: Is a directory (os error 21)\n```\n\n"));

        auto a = doc.find("```txt:a.txt");
        auto b = doc.find("```txt:b.txt");
        auto d = doc.find("```txt:d.txt");
        EXPECT(a < b && b < d && d != std::string::npos);
    }
    return failures;
}

static int test_read_text_file() {
    int failures = 0;
    TempDir tmp("snapshot_read");
    std::string out;
    std::string err;

    write_file(tmp.path() / "ok.txt", "h\xC3\xA9llo\n");
    EXPECT(core::read_text_file(tmp.path() / "ok.txt", out, err));
    EXPECT_EQ(out, std::string("h\xC3\xA9llo\n"));

    write_file(tmp.path() / "bad.txt", "\xC0\xAF");
    EXPECT(!core::read_text_file(tmp.path() / "bad.txt", out, err));
    EXPECT_EQ(err, std::string("stream did not contain valid UTF-8"));
    EXPECT(out.empty());

    EXPECT(!core::read_text_file(tmp.path() / "missing.txt", out, err));
    EXPECT_EQ(err, std::string("No such file or directory (os error 2)"));

    EXPECT(!core::read_text_file(tmp.path(), out, err));
    EXPECT_EQ(err, std::string("Is a directory (os error 21)"));
    return failures;
}

static int test_parallel_matches_sequential() {
    int failures = 0;
    TempDir tmp("snapshot_parallel");
    for (int i = 0; i < 50; ++i) {
        write_file(tmp.path() / ("m" + std::to_string(i % 5)) / ("f" + std::to_string(i) + ".cpp"),
                   "int v" + std::to_string(i) + " = " + std::to_string(i) + ";\n");
    }

    SnapshotOptions seq;
    seq.parallel_reads = false;
    SnapshotOptions par;
    par.parallel_reads = true;
    par.threads = 8;

    auto a = core::build_snapshot("p", tmp.path(), hermetic(), seq);
    auto b = core::build_snapshot("p", tmp.path(), hermetic(), par);
    EXPECT(a.has_value() && b.has_value());
    if (a && b) EXPECT(*a == *b);
    return failures;
}

static int test_nothing_to_include() {
    int failures = 0;
    TempDir tmp("snapshot_empty");
    EXPECT(!core::build_snapshot("x", tmp.path(), hermetic()).has_value());

    write_file(tmp.path() / "junk.log", "x");
    write_file(tmp.path() / ".gitignore", "*\n");
    core::ScanStats stats;
    EXPECT(!core::build_snapshot("x", tmp.path(), hermetic(), {}, &stats).has_value());
    EXPECT_EQ(stats.files, (std::size_t)0);
    EXPECT_EQ(stats.ignored, (std::size_t)2);
    return failures;
}

static int test_names_and_tags() {
    int failures = 0;
    EXPECT_EQ(core::project_name_for("/home/me/proj"), std::string("proj"));
    EXPECT_EQ(core::project_name_for("/home/me/proj/"), std::string("proj"));
    EXPECT_EQ(core::project_name_for("proj/."), std::string("proj"));
    EXPECT_EQ(core::project_name_for("."), std::string("."));
    EXPECT_EQ(core::project_name_for(".."), std::string(".."));
    EXPECT_EQ(core::project_name_for("/"), std::string("/"));

    EXPECT_EQ(core::language_tag("src/main.rs"), std::string("rs"));
    EXPECT_EQ(core::language_tag("a/b.tar.gz"), std::string("gz"));
    EXPECT_EQ(core::language_tag("Makefile"), std::string(""));
    EXPECT_EQ(core::language_tag(".gitignore"), std::string(""));

    EXPECT_EQ(core::display_path("/r", "/r/src/x.c"), std::string("src/x.c"));
    EXPECT_EQ(core::display_path(".", "./src/x.c"), std::string("src/x.c"));
    EXPECT_EQ(core::display_path("/r", "/other/x.c"), std::string("/other/x.c"));
    return failures;
}

int main() {
    utils::Logger::instance().set_stream(nullptr);

    int failures = 0;
    try {
        failures += test_end_to_end_document();
        failures += test_blocks_follow_tree_order();
        failures += test_unreadable_files_keep_their_block();
        failures += test_read_text_file();
        failures += test_parallel_matches_sequential();
        failures += test_nothing_to_include();
        failures += test_names_and_tags();
    } catch (const std::exception& e) {
        std::cerr << "exception: " << e.what() << "\n";
        return 1;
    }

    if (failures != 0) {
        std::cerr << "snapshot: " << failures << " failure(s)\n";
        return 1;
    }
    std::cout << "snapshot OK\n";
    return 0;
}
