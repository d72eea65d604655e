// filename: src/net_broker.cpp
#include <core/net_broker.hpp>
#include <core/log.hpp>
#include <core/staging_queue.hpp>
#include <vector>

namespace {

bool invalid(const JobPtr& job) {
    return !job || job->size() == 0;
}

// settlements only fail once the connection is closed
void log_settle(const boost::system::error_code& ec, std::uint64_t delivery_tag) {
    if (ec) LogLine(LogLevel::debug, "net") << "settling delivery " << delivery_tag << ": " << ec.message();
}

} // namespace

NetQueue::NetQueue(std::shared_ptr<NetConnection> conn, std::string name, std::string buried_name)
    : conn_(std::move(conn)), name_(std::move(name)), buried_name_(std::move(buried_name)) {}

boost::system::error_code NetQueue::publish(JobPtr job) {
    if (invalid(job)) return make_error_code(mq_errc::empty_job);
    return conn_->publish(name_, *job, std::chrono::milliseconds::zero());
}

boost::system::error_code NetQueue::publish_delayed(JobPtr job, std::chrono::milliseconds delay) {
    if (invalid(job)) return make_error_code(mq_errc::empty_job);
    return conn_->publish(name_, *job, delay);
}

boost::system::error_code NetQueue::transaction(const TxCallback& cb) {
    if (!cb) return {};
    StagingQueue staging;
    if (auto ec = cb(staging)) return ec;
    auto jobs = staging.take();
    if (jobs.empty()) return {};
    return conn_->publish_batch(name_, jobs);
}

std::shared_ptr<JobIter> NetQueue::consume(int window, boost::system::error_code& ec) {
    auto buffer = std::make_shared<DeliveryBuffer>();
    const auto tag = conn_->subscribe(name_, window, buffer, ec);
    if (ec) return nullptr;
    return std::make_shared<NetJobIter>(conn_, tag, std::move(buffer));
}

boost::system::error_code NetQueue::republish_buried(const RepublishConditions& conditions) {
    auto buffer = std::make_shared<DeliveryBuffer>();
    boost::system::error_code ec;
    const auto tag = conn_->subscribe(buried_name_, 0, buffer, ec);
    if (ec) return ec;

    boost::system::error_code result;
    std::size_t republished = 0;
    // non-matching deliveries stay unsettled until the scan is over so the
    // daemon does not hand them out again
    std::vector<Delivery> keep;
    for (;;) {
        auto d = buffer->wait_and_pop_for(conn_->config().buried_timeout);
        if (!d) break;
        if (d->generation != conn_->generation()) continue;

        const Job& job = *d->job;
        if (!comply(conditions, job)) {
            keep.push_back(std::move(*d));
            continue;
        }
        auto copy = job.clone();
        copy->error_type.clear();
        if (auto pec = conn_->publish(name_, *copy, std::chrono::milliseconds::zero())) {
            result = pec;
            log_settle(conn_->nack(d->delivery_tag, d->generation, true, job.retries, job.error_type),
                       d->delivery_tag);
            break;
        }
        log_settle(conn_->ack(d->delivery_tag, d->generation), d->delivery_tag);
        ++republished;
    }

    conn_->cancel(tag);
    buffer->close();
    while (auto d = buffer->try_pop()) {
        log_settle(conn_->nack(d->delivery_tag, d->generation, true, d->job->retries,
                               d->job->error_type),
                   d->delivery_tag);
    }

    // back to the end of the buried queue, in the order they were found
    for (auto& d : keep) {
        if (d.generation != conn_->generation()) continue;
        if (!result) {
            if (auto pec = conn_->publish(buried_name_, *d.job, std::chrono::milliseconds::zero())) {
                result = pec;
            }
        }
        if (result) {
            log_settle(conn_->nack(d.delivery_tag, d.generation, true, d.job->retries,
                                   d.job->error_type),
                       d.delivery_tag);
        } else {
            log_settle(conn_->ack(d.delivery_tag, d.generation), d.delivery_tag);
        }
    }

    LogLine(LogLevel::debug, "net") << "republished " << republished << " buried jobs on '" << name_
                                    << "', kept " << keep.size();
    return result;
}

NetJobIter::NetJobIter(std::shared_ptr<NetConnection> conn, std::uint64_t consumer_tag,
                       std::shared_ptr<DeliveryBuffer> buffer)
    : conn_(std::move(conn)), consumer_tag_(consumer_tag), buffer_(std::move(buffer)) {}

NetJobIter::~NetJobIter() {
    if (auto ec = close()) {
        LogLine(LogLevel::warn, "net") << "closing consumer " << consumer_tag_ << ": " << ec.message();
    }
}

void NetJobIter::requeue(const Delivery& d) {
    log_settle(conn_->nack(d.delivery_tag, d.generation, true, d.job->retries, d.job->error_type),
               d.delivery_tag);
}

boost::system::error_code NetJobIter::closed_error() const {
    auto failure = conn_->failure();
    return (!closed_.load(std::memory_order_acquire) && failure)
               ? failure : make_error_code(mq_errc::already_closed);
}

JobPtr NetJobIter::attach(const Delivery& d) {
    auto job = d.job;
    job->acknowledger = std::make_unique<NetAcknowledger>(conn_, d.delivery_tag, d.generation);
    return job;
}

JobPtr NetJobIter::next(boost::system::error_code& ec) {
    for (;;) {
        if (closed_.load(std::memory_order_acquire)) {
            ec = make_error_code(mq_errc::already_closed);
            return nullptr;
        }
        auto d = buffer_->wait_and_pop();
        if (!d) {
            ec = closed_error();
            return nullptr;
        }
        if (d->generation != conn_->generation()) continue;
        if (closed_.load(std::memory_order_acquire)) {
            requeue(*d);
            ec = make_error_code(mq_errc::already_closed);
            return nullptr;
        }
        ec.clear();
        return attach(*d);
    }
}

JobPtr NetJobIter::try_next(boost::system::error_code& ec) {
    if (closed_.load(std::memory_order_acquire)) {
        ec = make_error_code(mq_errc::already_closed);
        return nullptr;
    }
    while (auto d = buffer_->try_pop()) {
        if (d->generation != conn_->generation()) continue;
        ec.clear();
        return attach(*d);
    }
    if (!buffer_->is_open()) {
        ec = closed_error();
    } else {
        ec.clear();
    }
    return nullptr;
}

boost::system::error_code NetJobIter::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) return {};
    conn_->cancel(consumer_tag_);
    buffer_->close();
    while (auto d = buffer_->try_pop()) requeue(*d);
    return {};
}

boost::system::error_code NetAcknowledger::do_ack(const Job&) {
    return conn_->ack(delivery_tag_, generation_);
}

boost::system::error_code NetAcknowledger::do_reject(const Job& job, bool requeue) {
    return conn_->nack(delivery_tag_, generation_, requeue, job.retries, job.error_type);
}

NetBroker::NetBroker(std::shared_ptr<NetConnection> conn)
    : conn_(std::move(conn)) {}

NetBroker::~NetBroker() {
    if (auto ec = close()) {
        LogLine(LogLevel::warn, "net") << "closing broker: " << ec.message();
    }
}

QueuePtr NetBroker::queue(const std::string& name, boost::system::error_code& ec) {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) {
        ec = make_error_code(mq_errc::already_closed);
        return nullptr;
    }
    auto it = queues_.find(name);
    if (it != queues_.end()) {
        ec.clear();
        return it->second;
    }

    const auto& cfg = conn_->config();
    const std::string buried_queue = name + cfg.buried_queue_suffix;
    const std::string buried_exchange = name + cfg.buried_exchange_suffix;

    ec = conn_->declare(buried_queue, Priority::urgent, "");
    if (!ec) ec = conn_->bind(buried_exchange, buried_queue);
    if (!ec) ec = conn_->declare(name, Priority::urgent, buried_exchange);
    if (ec) {
        LogLine(LogLevel::error, "net") << "declaring queue '" << name << "' failed: " << ec.message();
        return nullptr;
    }

    it = queues_.emplace(name, std::make_shared<NetQueue>(conn_, name, buried_queue)).first;
    return it->second;
}

boost::system::error_code NetBroker::close() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return {};
        closed_ = true;
        queues_.clear();
    }
    conn_->close();
    return {};
}

BrokerPtr make_net_broker(const Uri& uri, boost::system::error_code& ec) {
    if (uri.host.empty() || uri.port.empty()) {
        LogLine(LogLevel::error, "net") << "jobq URI needs host and port";
        ec = make_error_code(mq_errc::invalid_uri);
        return nullptr;
    }

    NetConfig cfg;
    apply_env(cfg);
    if (auto qec = apply_query(cfg, uri)) {
        ec = qec;
        return nullptr;
    }

    auto conn = std::make_shared<NetConnection>(uri.host, uri.port, cfg);
    if (auto oec = conn->open()) {
        LogLine(LogLevel::error, "net") << "cannot connect to " << uri.host << ":" << uri.port << ": "
                                        << oec.message();
        conn->close();
        ec = oec;
        return nullptr;
    }
    ec.clear();
    return std::make_shared<NetBroker>(std::move(conn));
}
