// filename: src/memory_broker.cpp
#include <core/memory_broker.hpp>
#include <core/log.hpp>
#include <core/staging_queue.hpp>
#include <algorithm>
#include <thread>

namespace {

bool invalid(const JobPtr& job) {
    return !job || job->size() == 0;
}

} // namespace

MemoryQueue::MemoryQueue(std::string name, MemoryOptions opts,
                         std::shared_ptr<DelayScheduler> scheduler)
    : name_(std::move(name)), opts_(opts), scheduler_(std::move(scheduler)) {}

void MemoryQueue::enqueue_locked(JobPtr job) {
    PendingKey key{static_cast<std::uint8_t>(job->priority), next_seq_++};
    pending_.emplace(key, std::move(job));
}

boost::system::error_code MemoryQueue::publish(JobPtr job) {
    if (invalid(job)) return make_error_code(mq_errc::empty_job);
    auto copy = job->clone();
    std::lock_guard<std::mutex> lk(mu_);
    enqueue_locked(std::move(copy));
    return {};
}

boost::system::error_code MemoryQueue::publish_delayed(JobPtr job, std::chrono::milliseconds delay) {
    if (invalid(job)) return make_error_code(mq_errc::empty_job);
    if (delay <= std::chrono::milliseconds::zero()) return publish(std::move(job));

    std::weak_ptr<MemoryQueue> weak = shared_from_this();
    auto copy = job->clone();
    bool scheduled = scheduler_->schedule(delay, [weak, copy] {
        auto self = weak.lock();
        if (!self) return;
        auto ec = self->publish(copy);
        if (ec) {
            LogLine(LogLevel::error, "memory") << "delayed publish to '" << self->name() << "' failed: "
                                               << ec.message();
        }
    });
    if (!scheduled) return make_error_code(mq_errc::already_closed);
    return {};
}

boost::system::error_code MemoryQueue::transaction(const TxCallback& cb) {
    if (!cb) return {};
    StagingQueue staging;
    if (auto ec = cb(staging)) return ec;

    auto jobs = staging.take();
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& job : jobs) enqueue_locked(std::move(job));
    return {};
}

std::shared_ptr<JobIter> MemoryQueue::consume(int window, boost::system::error_code& ec) {
    auto iter = std::make_shared<MemoryJobIter>(shared_from_this(), window,
                                                opts_.finite, opts_.poll_interval);
    {
        std::lock_guard<std::mutex> lk(mu_);
        iters_.erase(std::remove_if(iters_.begin(), iters_.end(),
                                    [](const std::weak_ptr<MemoryJobIter>& w) { return w.expired(); }),
                     iters_.end());
        iters_.push_back(iter);
    }
    ec.clear();
    return iter;
}

boost::system::error_code MemoryQueue::republish_buried(const RepublishConditions& conditions) {
    auto jobs = buried_.take_matching(conditions);
    if (jobs.empty()) return {};
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& job : jobs) {
        job->error_type.clear();
        enqueue_locked(std::move(job));
    }
    LogLine(LogLevel::debug, "memory") << "republished buried jobs on '" << name_ << "'";
    return {};
}

std::size_t MemoryQueue::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.size();
}

JobPtr MemoryQueue::try_dequeue(std::uint64_t& seq) {
    std::lock_guard<std::mutex> lk(mu_);
    if (pending_.empty()) return nullptr;
    auto it = pending_.begin();
    seq = it->first.seq;
    JobPtr job = std::move(it->second);
    pending_.erase(it);
    return job;
}

void MemoryQueue::bury(JobPtr job) {
    buried_.bury(std::move(job));
}

void MemoryQueue::close_iterators() {
    std::vector<std::shared_ptr<MemoryJobIter>> live;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& w : iters_) {
            if (auto it = w.lock()) live.push_back(std::move(it));
        }
        iters_.clear();
    }
    for (auto& it : live) it->close();
}

MemoryJobIter::MemoryJobIter(std::shared_ptr<MemoryQueue> queue, int window,
                             bool finite, std::chrono::milliseconds poll_interval)
    : queue_(std::move(queue)),
      window_(window > 0 ? std::make_shared<Window>(static_cast<std::size_t>(window)) : nullptr),
      finite_(finite),
      poll_interval_(poll_interval) {}

void MemoryJobIter::release_slot() {
    if (window_) window_->release();
}

JobPtr MemoryJobIter::next(boost::system::error_code& ec) {
    if (closed()) {
        ec = make_error_code(mq_errc::already_closed);
        return nullptr;
    }
    if (window_ && !window_->acquire()) {
        ec = make_error_code(mq_errc::already_closed);
        return nullptr;
    }

    for (;;) {
        // closure is noticed once per poll tick
        if (closed()) {
            release_slot();
            ec = make_error_code(mq_errc::already_closed);
            return nullptr;
        }

        if (auto job = hand_out()) {
            ec.clear();
            return job;
        }

        if (finite_) {
            release_slot();
            ec = make_error_code(mq_errc::end_of_stream);
            return nullptr;
        }

        std::this_thread::sleep_for(poll_interval_);
    }
}

JobPtr MemoryJobIter::hand_out() {
    std::uint64_t seq = 0;
    auto job = queue_->try_dequeue(seq);
    if (!job) return nullptr;
    last_seq_.store(seq, std::memory_order_relaxed);
    job->acknowledger = std::make_unique<MemoryAcknowledger>(queue_, window_);
    return job;
}

JobPtr MemoryJobIter::try_next(boost::system::error_code& ec) {
    if (closed()) {
        ec = make_error_code(mq_errc::already_closed);
        return nullptr;
    }
    if (window_ && !window_->try_acquire()) {
        if (closed()) {
            ec = make_error_code(mq_errc::already_closed);
        } else {
            ec.clear();
        }
        return nullptr;
    }
    if (auto job = hand_out()) {
        ec.clear();
        return job;
    }
    release_slot();
    if (finite_) {
        ec = make_error_code(mq_errc::end_of_stream);
    } else {
        ec.clear();
    }
    return nullptr;
}

boost::system::error_code MemoryJobIter::close() {
    closed_.store(true, std::memory_order_release);
    if (window_) window_->close();
    return {};
}

void MemoryAcknowledger::release() {
    if (window_) window_->release();
}

boost::system::error_code MemoryAcknowledger::do_ack(const Job&) {
    release();
    return {};
}

boost::system::error_code MemoryAcknowledger::do_reject(const Job& job, bool requeue) {
    boost::system::error_code ec;
    if (requeue) {
        ec = queue_->publish(job.clone());
    } else {
        // keeps error_type and retries as set by the consumer
        queue_->bury(job.clone());
    }
    release();
    return ec;
}

MemoryBroker::MemoryBroker(MemoryOptions opts)
    : opts_(opts), scheduler_(std::make_shared<DelayScheduler>()) {}

MemoryBroker::~MemoryBroker() {
    if (auto ec = close()) {
        LogLine(LogLevel::warn, "memory") << "close on destruction: " << ec.message();
    }
}

QueuePtr MemoryBroker::queue(const std::string& name, boost::system::error_code& ec) {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) {
        ec = make_error_code(mq_errc::already_closed);
        return nullptr;
    }
    auto it = queues_.find(name);
    if (it == queues_.end()) {
        it = queues_.emplace(name, std::make_shared<MemoryQueue>(name, opts_, scheduler_)).first;
        LogLine(LogLevel::debug, "memory") << "created queue '" << name << "'";
    }
    ec.clear();
    return it->second;
}

boost::system::error_code MemoryBroker::close() {
    std::unordered_map<std::string, std::shared_ptr<MemoryQueue>> queues;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return {};
        closed_ = true;
        queues.swap(queues_);
    }
    scheduler_->stop();
    for (auto& kv : queues) kv.second->close_iterators();
    return {};
}

BrokerPtr make_memory_broker(const Uri& uri, bool finite, boost::system::error_code& ec) {
    MemoryOptions opts;
    opts.finite = finite;
    auto it = uri.query.find("poll_ms");
    if (it != uri.query.end()) {
        std::uint64_t ms = 0;
        if (!parse_uint(it->second, ms) || ms == 0) {
            LogLine(LogLevel::error, "memory") << "bad poll_ms '" << it->second << "'";
            ec = make_error_code(mq_errc::invalid_option);
            return nullptr;
        }
        opts.poll_interval = std::chrono::milliseconds(ms);
    }
    ec.clear();
    return std::make_shared<MemoryBroker>(opts);
}
