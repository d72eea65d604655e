// filename: core/delay_scheduler.hpp
#pragma once
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

// Runs callbacks after a delay on its own io_context thread.
// Used for delayed publishes so the publisher never blocks.
class DelayScheduler {
public:
    DelayScheduler();
    ~DelayScheduler();

    DelayScheduler(const DelayScheduler&) = delete;
    DelayScheduler& operator=(const DelayScheduler&) = delete;

    // false once stopped
    bool schedule(std::chrono::milliseconds delay, std::function<void()> fn);

    // Pending callbacks are dropped. Must not be called from a callback.
    void stop();

private:
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::atomic<bool> stopped_{false};
    std::thread thread_;
};
