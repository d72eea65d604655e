// filename: core/window.hpp
#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>

// Window: advertised-window semaphore of a JobIter.
// A slot is taken before a job is handed out and given back on ack/reject,
// so at most capacity() deliveries are unsettled at any time.

class Window {
public:
    explicit Window(std::size_t capacity) : capacity_(capacity) {}

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    // blocks while the window is full; false once closed
    bool acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return closed_ || held_ < capacity_; });
        if (closed_) return false;
        ++held_;
        return true;
    }

    // false when full or closed
    bool try_acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || held_ >= capacity_) return false;
        ++held_;
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (held_ > 0) --held_;
        }
        cond_.notify_one();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cond_.notify_all();
    }

    std::size_t in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return held_;
    }

    std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::size_t held_ = 0;
    bool closed_ = false;
};
