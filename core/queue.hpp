// filename: core/queue.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <core/job.hpp>
#include <chrono>
#include <functional>
#include <memory>

class Queue;

// Consumption cursor over one Queue. Safe to share between consumer threads.
class JobIter {
public:
    virtual ~JobIter() = default;

    // Blocks until a job is available. Fails with already_closed once the
    // iterator is closed, end_of_stream for finite backends with nothing left.
    virtual JobPtr next(boost::system::error_code& ec) = 0;

    // Non-blocking next(): nullptr with a clear ec when no job can be handed
    // out right now (nothing queued or the window is full).
    virtual JobPtr try_next(boost::system::error_code& ec) = 0;

    // Idempotent. Blocked and later next() calls fail with already_closed.
    virtual boost::system::error_code close() = 0;
};

// Callback run inside Queue::transaction. Returning an error discards every
// job published through the staging queue.
using TxCallback = std::function<boost::system::error_code(Queue&)>;

class Queue {
public:
    virtual ~Queue() = default;

    virtual boost::system::error_code publish(JobPtr job) = 0;

    // job becomes visible to consumers once delay has elapsed
    virtual boost::system::error_code publish_delayed(JobPtr job,
                                                      std::chrono::milliseconds delay) = 0;

    virtual boost::system::error_code transaction(const TxCallback& cb) = 0;

    // window <= 0 means no limit on unsettled deliveries
    virtual std::shared_ptr<JobIter> consume(int window, boost::system::error_code& ec) = 0;

    virtual boost::system::error_code republish_buried(
        const RepublishConditions& conditions = {}) = 0;
};

using QueuePtr = std::shared_ptr<Queue>;
