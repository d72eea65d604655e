// filename: src/job.cpp
#include <core/job.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

boost::system::error_code Acknowledger::ack(const Job& job) {
    if (settled_.exchange(true, std::memory_order_acq_rel)) {
        return make_error_code(mq_errc::cannot_acknowledge);
    }
    return do_ack(job);
}

boost::system::error_code Acknowledger::reject(const Job& job, bool requeue) {
    if (settled_.exchange(true, std::memory_order_acq_rel)) {
        return make_error_code(mq_errc::cannot_acknowledge);
    }
    return do_reject(job, requeue);
}

std::shared_ptr<Job> Job::make() {
    auto job = std::make_shared<Job>();
    job->id = generate_job_id();
    job->priority = Priority::normal;
    job->timestamp = std::chrono::system_clock::now();
    job->content_type = kContentTypeText;
    return job;
}

std::shared_ptr<Job> Job::clone() const {
    auto copy = std::make_shared<Job>();
    copy->id = id;
    copy->priority = priority;
    copy->timestamp = timestamp;
    copy->retries = retries;
    copy->error_type = error_type;
    copy->content_type = content_type;
    copy->raw = raw;
    return copy;
}

boost::system::error_code Job::ack() {
    if (!acknowledger) return make_error_code(mq_errc::cannot_acknowledge);
    return acknowledger->ack(*this);
}

boost::system::error_code Job::reject(bool requeue) {
    if (!acknowledger) return make_error_code(mq_errc::cannot_acknowledge);
    return acknowledger->reject(*this, requeue);
}

bool comply(const RepublishConditions& conditions, const Job& job) {
    for (const auto& cond : conditions) {
        if (cond && !cond(job)) return false;
    }
    return true;
}

std::string generate_job_id() {
    // random_generator is not thread safe; one per thread
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}
