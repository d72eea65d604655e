// filename: src/delay_scheduler.cpp
#include <core/delay_scheduler.hpp>
#include <core/log.hpp>
#include <exception>
#include <memory>

DelayScheduler::DelayScheduler()
    : work_(boost::asio::make_work_guard(io_)) {
    thread_ = std::thread([this] {
        for (;;) {
            try {
                io_.run();
                return;
            } catch (const std::exception& e) {
                // keep the timer thread alive if a callback throws
                LogLine(LogLevel::error, "scheduler") << "delayed callback threw: " << e.what();
            }
        }
    });
}

DelayScheduler::~DelayScheduler() {
    stop();
}

bool DelayScheduler::schedule(std::chrono::milliseconds delay, std::function<void()> fn) {
    if (stopped_.load(std::memory_order_acquire)) return false;
    auto timer = std::make_shared<boost::asio::steady_timer>(io_);
    timer->expires_after(delay);
    timer->async_wait([timer, fn = std::move(fn)](const boost::system::error_code& ec) {
        if (!ec) fn();
    });
    return true;
}

void DelayScheduler::stop() {
    if (stopped_.exchange(true, std::memory_order_acq_rel)) return;
    work_.reset();
    io_.stop();
    if (thread_.joinable()) thread_.join();
}
