// filename: core/mutex_queue.hpp
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

// MutexQueue: blocking, uses condition_variable to avoid busy-waiting.
// Holds deliveries pushed by the network thread until a JobIter takes them.
// close() wakes every waiter; items left behind are still handed out by
// try_pop but waiters return nullopt once the queue is closed.

template<typename T>
class MutexQueue {
private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    bool open_ = true;
public:
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_) return false;
            queue_.push(std::move(item));
        }
        cond_.notify_one();
        return true;
    }

    std::optional<T> wait_and_pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this]{ return !open_ || !queue_.empty(); });
        if (!open_) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    // nullopt on timeout or close
    template <typename Rep, typename Period>
    std::optional<T> wait_and_pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cond_.wait_for(lock, timeout, [this]{ return !open_ || !queue_.empty(); })) {
            return std::nullopt;
        }
        if (!open_) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
        }
        cond_.notify_all();
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }
};
