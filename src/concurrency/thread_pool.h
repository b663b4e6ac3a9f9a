#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "blocking_queue.h"

// Fixed-size worker pool.
// - submit(...) returns std::future<R>; exceptions travel through the future
// - post(...) is fire-and-forget; tasks may post further tasks from inside
//   a worker (the directory walker fans out this way)
// - shutdown() / destructor drain the queue and join the workers
class ThreadPool {
public:
    // 0 -> std::thread::hardware_concurrency(), at least 1
    explicit ThreadPool(std::size_t thread_count);
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    ~ThreadPool();

    static std::size_t resolve_thread_count(std::size_t requested);

    template <class F, class... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>
    {
        using R = std::invoke_result_t<F, Args...>;

        auto task_ptr = std::make_shared<std::packaged_task<R()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<R> fut = task_ptr->get_future();
        enqueue_([task_ptr]() { (*task_ptr)(); });
        return fut;
    }

    // An exception escaping the job is logged and the worker moves on.
    void post(std::function<void()> job);

    // Stops accepting new tasks, lets queued ones finish, joins workers.
    // Safe to call multiple times.
    void shutdown();

    std::size_t size() const { return workers_.size(); }

private:
    using Job = std::function<void()>;

    void enqueue_(Job job);
    void worker_loop();

    std::vector<std::thread> workers_;
    BlockingQueue<Job> queue_;
    std::atomic<bool> accepting_{true};
};
