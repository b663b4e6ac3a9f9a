#include "file_scanner.h"

#include <algorithm>
#include <atomic>
#include <functional>
#include <memory>
#include <system_error>
#include <utility>

#include "concurrency/thread_pool.h"
#include "utils/logging.h"
#include "utils/time_utils.h"

namespace core {

namespace fs = std::filesystem;

void sort_unique_paths(FilteredPathList& paths) {
    // path ordering is per component, the same order render_tree uses
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
}

FilteredPathList collect_paths(BlockingQueue<fs::path>& channel) {
    FilteredPathList paths = channel.drain();
    sort_unique_paths(paths);
    return paths;
}

struct FileScanner::DirTask {
    fs::path dir;            // spelled relative to the caller's root
    std::string abs_dir;     // generic absolute form, for rule matching
    IgnoreStackPtr stack;    // rules in force for this directory
    bool rules_loaded = false;  // stack already includes dir's own ignore files
    // canonical directories from the root down; only kept when following symlinks
    std::shared_ptr<const std::vector<std::string>> ancestors;
};

struct FileScanner::WalkContext {
    WalkContext(const RuleSetResolver& r, ThreadPool& p, BlockingQueue<fs::path>& ch)
        : resolver(r), pool(p), results(ch) {}

    const RuleSetResolver& resolver;
    ThreadPool& pool;
    BlockingQueue<fs::path>& results;

    // Outstanding directory tasks; whoever brings it to zero closes results.
    std::atomic<std::size_t> pending{0};

    std::atomic<std::size_t> directories{0};
    std::atomic<std::size_t> ignored{0};
    std::atomic<std::size_t> skipped{0};

    void task_finished() {
        if (pending.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            results.close();
        }
    }
};

namespace {

struct TaskGuard {
    explicit TaskGuard(std::function<void()> on_exit) : on_exit_(std::move(on_exit)) {}
    TaskGuard(const TaskGuard&) = delete;
    TaskGuard& operator=(const TaskGuard&) = delete;
    ~TaskGuard() { on_exit_(); }

private:
    std::function<void()> on_exit_;
};

std::string canonical_string(const fs::path& p) {
    std::error_code ec;
    auto c = fs::canonical(p, ec);
    if (ec) return {};
    return c.generic_string();
}

} // namespace

FileScanner::FileScanner(ScanOptions cfg) : cfg_(std::move(cfg)) {}

void FileScanner::spawn_(WalkContext& ctx, DirTask task) const {
    ctx.pending.fetch_add(1, std::memory_order_relaxed);
    try {
        ctx.pool.post([this, &ctx, task = std::move(task)]() mutable {
            walk_directory_(ctx, std::move(task));
        });
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Cannot schedule directory walk: ") + e.what());
        ctx.skipped.fetch_add(1, std::memory_order_relaxed);
        ctx.task_finished();
    }
}

void FileScanner::walk_directory_(WalkContext& ctx, DirTask task) const {
    TaskGuard guard([&ctx]() { ctx.task_finished(); });

    IgnoreStackPtr stack = task.rules_loaded
        ? task.stack
        : ctx.resolver.descend(task.stack, task.dir, task.abs_dir);

    ctx.directories.fetch_add(1, std::memory_order_relaxed);

    std::error_code ec;
    for (fs::directory_iterator it(task.dir, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        const std::string name = entry.path().filename().string();

        std::error_code eec;
        fs::file_status st = entry.symlink_status(eec);
        if (eec) {
            LOG_DEBUG("Skipping unreadable entry " + entry.path().string() + ": " + eec.message());
            ctx.skipped.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        bool via_link = false;
        if (fs::is_symlink(st)) {
            if (!cfg_.follow_symlinks) {
                LOG_TRACE("Skipping symlink " + entry.path().string());
                ctx.skipped.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            st = entry.status(eec);
            if (eec || !fs::exists(st)) {
                LOG_DEBUG("Skipping broken symlink " + entry.path().string());
                ctx.skipped.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            via_link = true;
        }

        const bool is_dir = fs::is_directory(st);
        if (!is_dir && !fs::is_regular_file(st)) {
            LOG_TRACE("Skipping special file " + entry.path().string());
            ctx.skipped.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        std::string abs_path = join_generic(task.abs_dir, name);
        if (ctx.resolver.evaluate(stack, abs_path, name, is_dir) == Match::Ignore) {
            LOG_TRACE(std::string(is_dir ? "Pruned " : "Ignored ") + abs_path);
            ctx.ignored.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        if (!is_dir) {
            if (!ctx.results.push(entry.path())) {
                LOG_ERROR("Result channel closed early, dropping " + entry.path().string());
            }
            continue;
        }

        DirTask child;
        child.dir = entry.path();
        child.abs_dir = std::move(abs_path);
        child.stack = stack;
        child.ancestors = task.ancestors;

        if (cfg_.follow_symlinks && task.ancestors) {
            std::string canon = canonical_string(entry.path());
            const auto& seen = *task.ancestors;
            if (via_link && !canon.empty() && std::find(seen.begin(), seen.end(), canon) != seen.end()) {
                LOG_WARN("Skipping symlink loop " + entry.path().string() + " -> " + canon);
                ctx.skipped.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            auto next = std::make_shared<std::vector<std::string>>(seen);
            next->push_back(std::move(canon));
            child.ancestors = std::move(next);
        }

        spawn_(ctx, std::move(child));
    }

    if (ec) {
        LOG_DEBUG("Cannot list directory " + task.dir.string() + ": " + ec.message());
        ctx.skipped.fetch_add(1, std::memory_order_relaxed);
    }
}

FilteredPathList FileScanner::scan(const fs::path& root, ScanStats* stats) const {
    utils::Stopwatch sw;
    FilteredPathList out;

    std::error_code ec;
    fs::file_status st = fs::status(root, ec);
    if (ec || !fs::exists(st)) {
        LOG_WARN("Scan root does not exist: " + root.string());
        return out;
    }
    if (fs::is_regular_file(st)) {
        out.push_back(root);
        if (stats) {
            *stats = ScanStats{};
            stats->files = 1;
            stats->elapsed_ms = sw.elapsed_ms();
        }
        return out;
    }
    if (!fs::is_directory(st)) {
        LOG_WARN("Scan root is neither a directory nor a regular file: " + root.string());
        return out;
    }

    RuleSetResolver resolver(root, cfg_.rules);
    BlockingQueue<fs::path> channel;
    ThreadPool pool(cfg_.threads);
    WalkContext ctx(resolver, pool, channel);

    DirTask first;
    first.dir = root;
    first.abs_dir = resolver.root();
    first.stack = resolver.root_stack();
    first.rules_loaded = true;
    if (cfg_.follow_symlinks) {
        first.ancestors = std::make_shared<std::vector<std::string>>(
            std::vector<std::string>{canonical_string(root)});
    }
    spawn_(ctx, std::move(first));

    out = collect_paths(channel);
    pool.shutdown();

    ScanStats s;
    s.files = out.size();
    s.directories = ctx.directories.load();
    s.ignored = ctx.ignored.load();
    s.skipped = ctx.skipped.load();
    s.elapsed_ms = sw.elapsed_ms();
    if (stats) *stats = s;

    LOG_INFO(
        "Scan done: root=" + resolver.root() +
        " files=" + std::to_string(s.files) +
        " dirs=" + std::to_string(s.directories) +
        " ignored=" + std::to_string(s.ignored) +
        " skipped=" + std::to_string(s.skipped) +
        " threads=" + std::to_string(ThreadPool::resolve_thread_count(cfg_.threads)) +
        " t_ms=" + std::to_string(s.elapsed_ms)
    );

    return out;
}

} // namespace core
