// filename: core/staging_queue.hpp
#pragma once
#include <core/queue.hpp>
#include <vector>

// Queue handed to a transaction callback. Publishes are buffered and merged
// by the owning queue only if the callback succeeds. Nested transactions,
// consuming and republishing are not available on it.
class StagingQueue : public Queue {
public:
    boost::system::error_code publish(JobPtr job) override;
    // staged right away; the delay is not applied inside a transaction
    boost::system::error_code publish_delayed(JobPtr job,
                                              std::chrono::milliseconds delay) override;
    boost::system::error_code transaction(const TxCallback& cb) override;
    std::shared_ptr<JobIter> consume(int window, boost::system::error_code& ec) override;
    boost::system::error_code republish_buried(const RepublishConditions& conditions) override;

    const std::vector<JobPtr>& staged() const noexcept { return staged_; }
    std::vector<JobPtr> take() { return std::move(staged_); }

private:
    std::vector<JobPtr> staged_;
};
