// filename: core/broker_registry.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <core/broker.hpp>
#include <core/uri.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Maps URI schemes to broker constructors. Registration is thread-safe so
// backends may register concurrently during start-up.
class BrokerRegistry {
public:
    using Constructor = std::function<BrokerPtr(const Uri&, boost::system::error_code&)>;

    // memory://, memoryfinite:// and jobq://
    static BrokerRegistry with_default_backends();

    BrokerRegistry() = default;
    BrokerRegistry(BrokerRegistry&& other) noexcept;
    BrokerRegistry& operator=(BrokerRegistry&&) = delete;
    BrokerRegistry(const BrokerRegistry&) = delete;
    BrokerRegistry& operator=(const BrokerRegistry&) = delete;

    // replaces any constructor already registered for the scheme
    void register_scheme(const std::string& scheme, Constructor ctor);
    bool has_scheme(const std::string& scheme) const;
    std::vector<std::string> schemes() const;

    BrokerPtr make_broker(const std::string& uri, boost::system::error_code& ec) const;

private:
    mutable std::mutex mu_;
    std::map<std::string, Constructor> ctors_;
};
