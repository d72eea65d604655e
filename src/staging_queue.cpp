// filename: src/staging_queue.cpp
#include <core/staging_queue.hpp>

boost::system::error_code StagingQueue::publish(JobPtr job) {
    if (!job || job->size() == 0) return make_error_code(mq_errc::empty_job);
    staged_.push_back(job->clone());
    return {};
}

boost::system::error_code StagingQueue::publish_delayed(JobPtr job, std::chrono::milliseconds) {
    return publish(std::move(job));
}

boost::system::error_code StagingQueue::transaction(const TxCallback&) {
    return make_error_code(mq_errc::transactions_not_supported);
}

std::shared_ptr<JobIter> StagingQueue::consume(int, boost::system::error_code& ec) {
    ec = make_error_code(mq_errc::transactions_not_supported);
    return nullptr;
}

boost::system::error_code StagingQueue::republish_buried(const RepublishConditions&) {
    return make_error_code(mq_errc::transactions_not_supported);
}
