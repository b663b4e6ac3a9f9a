#include "thread_pool.h"

#include "utils/logging.h"

std::size_t ThreadPool::resolve_thread_count(std::size_t requested) {
    if (requested != 0) return requested;
    std::size_t hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : hw;
}

ThreadPool::ThreadPool(std::size_t thread_count) {
    thread_count = resolve_thread_count(thread_count);

    workers_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::enqueue_(Job job) {
    if (!accepting_.load(std::memory_order_acquire)) {
        throw std::runtime_error("ThreadPool is not accepting new tasks (shutdown in progress)");
    }
    if (!queue_.push(std::move(job))) {
        throw std::runtime_error("ThreadPool queue is closed");
    }
}

void ThreadPool::post(std::function<void()> job) {
    enqueue_([job = std::move(job)]() {
        try {
            job();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("ThreadPool task failed: ") + e.what());
        } catch (...) {
            LOG_ERROR("ThreadPool task failed: non-standard exception");
        }
    });
}

void ThreadPool::shutdown() {
    bool expected = true;
    if (!accepting_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    queue_.close();

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

void ThreadPool::worker_loop() {
    while (auto job = queue_.pop()) {
        (*job)();
    }
}
