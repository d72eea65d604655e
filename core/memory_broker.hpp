// filename: core/memory_broker.hpp
#pragma once
#include <core/broker.hpp>
#include <core/buried_store.hpp>
#include <core/delay_scheduler.hpp>
#include <core/uri.hpp>
#include <core/window.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct MemoryOptions {
    // iterators report end_of_stream instead of waiting on an empty queue
    bool finite = false;
    // sleep between dequeue attempts of a waiting next()
    std::chrono::milliseconds poll_interval{100};
};

class MemoryJobIter;

// In-process queue. Pending jobs are kept in an arena ordered by priority
// (highest first) and then by publish sequence; a dequeue removes the job.
class MemoryQueue : public Queue, public std::enable_shared_from_this<MemoryQueue> {
public:
    MemoryQueue(std::string name, MemoryOptions opts, std::shared_ptr<DelayScheduler> scheduler);

    boost::system::error_code publish(JobPtr job) override;
    boost::system::error_code publish_delayed(JobPtr job,
                                              std::chrono::milliseconds delay) override;
    boost::system::error_code transaction(const TxCallback& cb) override;
    std::shared_ptr<JobIter> consume(int window, boost::system::error_code& ec) override;
    boost::system::error_code republish_buried(const RepublishConditions& conditions) override;

    const std::string& name() const noexcept { return name_; }
    std::size_t pending() const;
    std::size_t buried() const { return buried_.size(); }
    std::vector<JobPtr> buried_jobs() const { return buried_.snapshot(); }

    // Takes the best pending job; nullptr if there is none.
    JobPtr try_dequeue(std::uint64_t& seq);
    void bury(JobPtr job);
    // every iterator over this queue becomes closed
    void close_iterators();

private:
    struct PendingKey {
        std::uint8_t priority;
        std::uint64_t seq;
        bool operator<(const PendingKey& o) const {
            if (priority != o.priority) return priority > o.priority;
            return seq < o.seq;
        }
    };

    void enqueue_locked(JobPtr job);

    const std::string name_;
    const MemoryOptions opts_;
    std::shared_ptr<DelayScheduler> scheduler_;

    mutable std::mutex mu_;
    std::map<PendingKey, JobPtr> pending_;
    std::uint64_t next_seq_ = 1;
    std::vector<std::weak_ptr<MemoryJobIter>> iters_;

    BuriedStore buried_;
};

class MemoryJobIter : public JobIter {
public:
    // window <= 0: unbounded
    MemoryJobIter(std::shared_ptr<MemoryQueue> queue, int window,
                  bool finite, std::chrono::milliseconds poll_interval);

    JobPtr next(boost::system::error_code& ec) override;
    JobPtr try_next(boost::system::error_code& ec) override;
    boost::system::error_code close() override;

    bool closed() const noexcept { return closed_.load(std::memory_order_acquire); }
    // sequence id of the last job handed out by this iterator, 0 if none
    std::uint64_t last_delivered() const noexcept { return last_seq_.load(std::memory_order_relaxed); }
    // unsettled deliveries; always 0 for an unbounded iterator
    std::size_t in_flight() const { return window_ ? window_->in_flight() : 0; }

private:
    void release_slot();
    // dequeues the best job and binds an acknowledger to it
    JobPtr hand_out();

    std::shared_ptr<MemoryQueue> queue_;
    std::shared_ptr<Window> window_;
    const bool finite_;
    const std::chrono::milliseconds poll_interval_;
    std::atomic<bool> closed_{false};
    std::atomic<std::uint64_t> last_seq_{0};
};

class MemoryAcknowledger : public Acknowledger {
public:
    MemoryAcknowledger(std::shared_ptr<MemoryQueue> queue, std::shared_ptr<Window> window)
        : queue_(std::move(queue)), window_(std::move(window)) {}

protected:
    boost::system::error_code do_ack(const Job& job) override;
    boost::system::error_code do_reject(const Job& job, bool requeue) override;

private:
    void release();

    std::shared_ptr<MemoryQueue> queue_;
    std::shared_ptr<Window> window_;
};

class MemoryBroker : public Broker {
public:
    explicit MemoryBroker(MemoryOptions opts = {});
    ~MemoryBroker() override;

    QueuePtr queue(const std::string& name, boost::system::error_code& ec) override;
    boost::system::error_code close() override;

private:
    const MemoryOptions opts_;
    std::shared_ptr<DelayScheduler> scheduler_;
    std::mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<MemoryQueue>> queues_;
    bool closed_ = false;
};

// Registry constructors for memory:// and memoryfinite://
BrokerPtr make_memory_broker(const Uri& uri, bool finite, boost::system::error_code& ec);
