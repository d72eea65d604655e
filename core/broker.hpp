// filename: core/broker.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <core/queue.hpp>
#include <memory>
#include <string>

// Connection-scoped factory of named queues.
class Broker {
public:
    virtual ~Broker() = default;

    // Lazily creates the queue; the same name always yields the same Queue.
    virtual QueuePtr queue(const std::string& name, boost::system::error_code& ec) = 0;

    virtual boost::system::error_code close() = 0;
};

using BrokerPtr = std::shared_ptr<Broker>;
