#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

// Thread-safe blocking queue with close() semantics.
// - Multiple producers / multiple consumers.
// - pop() blocks until an item is available OR the queue is closed and empty.
// - close() wakes all waiters; after close no pushes are accepted.
// Used as the job queue of ThreadPool and as the result channel of the
// directory walker.
template <typename T>
class BlockingQueue {
public:
    BlockingQueue() = default;
    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    // Returns false if queue is closed (item is not pushed).
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mu_);
        if (closed_) return false;
        q_.push_back(std::move(item));
        lock.unlock();
        cv_.notify_one();
        return true;
    }

    // Blocking pop.
    // Returns std::nullopt if queue is closed AND empty.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [&] { return closed_ || !q_.empty(); });

        if (q_.empty()) {
            return std::nullopt;
        }

        T item = std::move(q_.front());
        q_.pop_front();
        return item;
    }

    // Blocks until the queue is closed, then hands back everything buffered
    // in push order.
    std::vector<T> drain() {
        std::vector<T> out;
        while (auto item = pop()) {
            out.push_back(std::move(*item));
        }
        return out;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
        cv_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mu_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return q_.size();
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> q_;
    bool closed_ = false;
};
