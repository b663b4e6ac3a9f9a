#include "cli_options.h"

#include <stdexcept>

namespace apps {

const char* const kVersion = "dirsnap 0.3.0";

const char* const kUsage =
    "Usage: dirsnap [PATH] [options]\n"
    "\n"
    "Writes a Markdown snapshot of PATH (default \".\"): a tree of the files that\n"
    "survive .gitignore/.ignore rules followed by the contents of each file.\n"
    "\n"
    "Options:\n"
    "  -o, --out FILE          write the snapshot to FILE instead of stdout\n"
    "  -t, --text              print to stdout (default)\n"
    "      --threads N         worker threads, 0 = hardware concurrency\n"
    "      --follow-symlinks   descend into symlinked directories, include linked files\n"
    "      --no-global-ignore  skip the user's global git excludes file\n"
    "      --no-parent-ignores skip ignore files above PATH\n"
    "      --no-git-exclude    skip .git/info/exclude\n"
    "      --no-ignore-files   honor .gitignore only, not .ignore\n"
    "      --config FILE       settings file (default dirsnap.env)\n"
    "      --log_level L       trace|debug|info|warn|error (default warn)\n"
    "      --log_file F        also append log lines to F\n"
    "  -h, --help              show this help\n"
    "  -V, --version           show the version\n";

namespace {

std::optional<std::size_t> parse_count(const std::string& s) {
    if (s.empty() || s[0] == '-') return std::nullopt;
    try {
        std::size_t pos = 0;
        unsigned long v = std::stoul(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return (std::size_t)v;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

} // namespace

Args parse_args(int argc, char** argv) {
    Args a;
    bool have_path = false;
    for (int i = 1; i < argc && a.error.empty(); ++i) {
        std::string k = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 < argc) {
                out = argv[++i];
                return true;
            }
            a.error = "missing value for " + k;
            return false;
        };

        if (k == "-o" || k == "--out") { std::string v; if (next(v)) a.out = v; }
        else if (k == "-t" || k == "--text") a.out.reset();
        else if (k == "--threads") {
            std::string v;
            if (next(v)) {
                a.threads = parse_count(v);
                if (!a.threads) a.error = "invalid thread count: " + v;
            }
        }
        else if (k == "--follow-symlinks") a.follow_symlinks = true;
        else if (k == "--no-global-ignore") a.global_ignore = false;
        else if (k == "--no-parent-ignores") a.parent_ignores = false;
        else if (k == "--no-git-exclude") a.git_exclude = false;
        else if (k == "--no-ignore-files") a.ignore_files = false;
        else if (k == "--config") next(a.config_path);
        else if (k == "--log_file") { std::string v; if (next(v)) a.log_file = v; }
        else if (k == "--log_level") { std::string v; if (next(v)) a.log_level = v; }
        else if (k == "-h" || k == "--help") a.help = true;
        else if (k == "-V" || k == "--version") a.version = true;
        else if (k.size() > 1 && k[0] == '-') a.error = "unknown option: " + k;
        else if (!have_path) { a.path = k; have_path = true; }
        else a.error = "unexpected argument: " + k;
    }
    return a;
}

Settings resolve_settings(const Args& args, const utils::Config& cfg) {
    Settings s;
    s.log_level = args.log_level.value_or(cfg.get_string("LOG_LEVEL", "warn"));
    s.log_file = args.log_file.value_or(cfg.get_string("LOG_FILE", ""));

    core::ScanOptions& scan = s.scan;
    scan.threads = args.threads.value_or(cfg.get_size("DIRSNAP_THREADS", 0));
    scan.follow_symlinks = args.follow_symlinks.value_or(cfg.get_bool("DIRSNAP_FOLLOW_SYMLINKS", false));
    scan.rules.global_ignore = args.global_ignore.value_or(cfg.get_bool("DIRSNAP_GLOBAL_IGNORE", true));
    scan.rules.parent_ignores = args.parent_ignores.value_or(cfg.get_bool("DIRSNAP_PARENT_IGNORES", true));
    scan.rules.git_exclude = args.git_exclude.value_or(cfg.get_bool("DIRSNAP_GIT_EXCLUDE", true));
    scan.rules.ignore_files = args.ignore_files.value_or(cfg.get_bool("DIRSNAP_IGNORE_FILES", true));

    s.snap.threads = scan.threads;
    s.snap.parallel_reads = cfg.get_bool("DIRSNAP_PARALLEL_READS", true);
    return s;
}

} // namespace apps
