// filename: core/net_broker.hpp
#pragma once
#include <core/broker.hpp>
#include <core/net_connection.hpp>
#include <core/uri.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

// jobq:// backend: queues hosted by a jobqd daemon, reached over one
// NetConnection per broker.
//
// Every queue Q gets a companion buried queue Q + buried_queue_suffix, fed
// through the exchange Q + buried_exchange_suffix, which is Q's dead-letter
// exchange. Rejecting without requeue sends the job there.

class NetQueue : public Queue {
public:
    NetQueue(std::shared_ptr<NetConnection> conn, std::string name, std::string buried_name);

    boost::system::error_code publish(JobPtr job) override;
    boost::system::error_code publish_delayed(JobPtr job,
                                              std::chrono::milliseconds delay) override;
    // staged jobs go out as one batch the daemon applies atomically
    boost::system::error_code transaction(const TxCallback& cb) override;
    std::shared_ptr<JobIter> consume(int window, boost::system::error_code& ec) override;
    // Drains the buried queue until it stays quiet for buried_timeout.
    boost::system::error_code republish_buried(const RepublishConditions& conditions) override;

    const std::string& name() const noexcept { return name_; }
    const std::string& buried_name() const noexcept { return buried_name_; }

private:
    std::shared_ptr<NetConnection> conn_;
    const std::string name_;
    const std::string buried_name_;
};

class NetJobIter : public JobIter {
public:
    NetJobIter(std::shared_ptr<NetConnection> conn, std::uint64_t consumer_tag,
               std::shared_ptr<DeliveryBuffer> buffer);
    ~NetJobIter() override;

    // Blocks until a delivery arrives. Deliveries from before a reconnect
    // are skipped; the daemon hands them out again.
    JobPtr next(boost::system::error_code& ec) override;
    JobPtr try_next(boost::system::error_code& ec) override;
    boost::system::error_code close() override;

private:
    void requeue(const Delivery& d);
    JobPtr attach(const Delivery& d);
    // error for an iterator whose buffer was closed
    boost::system::error_code closed_error() const;

    std::shared_ptr<NetConnection> conn_;
    const std::uint64_t consumer_tag_;
    std::shared_ptr<DeliveryBuffer> buffer_;
    std::atomic<bool> closed_{false};
};

class NetAcknowledger : public Acknowledger {
public:
    NetAcknowledger(std::shared_ptr<NetConnection> conn, std::uint64_t delivery_tag,
                    std::uint64_t generation)
        : conn_(std::move(conn)), delivery_tag_(delivery_tag), generation_(generation) {}

protected:
    boost::system::error_code do_ack(const Job& job) override;
    // retries and error_type travel with the reject
    boost::system::error_code do_reject(const Job& job, bool requeue) override;

private:
    std::shared_ptr<NetConnection> conn_;
    const std::uint64_t delivery_tag_;
    const std::uint64_t generation_;
};

class NetBroker : public Broker {
public:
    explicit NetBroker(std::shared_ptr<NetConnection> conn);
    ~NetBroker() override;

    // Declares the queue and its buried topology on first use.
    QueuePtr queue(const std::string& name, boost::system::error_code& ec) override;
    boost::system::error_code close() override;

    const std::shared_ptr<NetConnection>& connection() const noexcept { return conn_; }

private:
    std::shared_ptr<NetConnection> conn_;
    std::mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<NetQueue>> queues_;
    bool closed_ = false;
};

// Registry constructor for jobq://host:port. Options come from JOBQ_*
// variables and the URI query; fails if the first connect does not succeed.
BrokerPtr make_net_broker(const Uri& uri, boost::system::error_code& ec);
