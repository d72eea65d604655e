// filename: src/broker_registry.cpp
#include <core/broker_registry.hpp>
#include <core/log.hpp>
#include <core/memory_broker.hpp>
#include <core/net_broker.hpp>

BrokerRegistry BrokerRegistry::with_default_backends() {
    BrokerRegistry reg;
    reg.register_scheme("memory", [](const Uri& uri, boost::system::error_code& ec) {
        return make_memory_broker(uri, false, ec);
    });
    reg.register_scheme("memoryfinite", [](const Uri& uri, boost::system::error_code& ec) {
        return make_memory_broker(uri, true, ec);
    });
    reg.register_scheme("jobq", [](const Uri& uri, boost::system::error_code& ec) {
        return make_net_broker(uri, ec);
    });
    return reg;
}

BrokerRegistry::BrokerRegistry(BrokerRegistry&& other) noexcept {
    std::lock_guard<std::mutex> lk(other.mu_);
    ctors_ = std::move(other.ctors_);
}

void BrokerRegistry::register_scheme(const std::string& scheme, Constructor ctor) {
    std::lock_guard<std::mutex> lk(mu_);
    ctors_[scheme] = std::move(ctor);
}

bool BrokerRegistry::has_scheme(const std::string& scheme) const {
    std::lock_guard<std::mutex> lk(mu_);
    return ctors_.count(scheme) != 0;
}

std::vector<std::string> BrokerRegistry::schemes() const {
    std::vector<std::string> out;
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : ctors_) out.push_back(kv.first);
    return out;
}

BrokerPtr BrokerRegistry::make_broker(const std::string& text, boost::system::error_code& ec) const {
    Uri uri;
    if (!parse_uri(text, uri)) {
        LogLine(LogLevel::warn, "registry") << "cannot parse broker URI '" << text << "'";
        ec = make_error_code(mq_errc::invalid_uri);
        return nullptr;
    }

    Constructor ctor;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = ctors_.find(uri.scheme);
        if (it == ctors_.end()) {
            ec = make_error_code(mq_errc::unsupported_scheme);
            return nullptr;
        }
        ctor = it->second;
    }
    // constructors may block (network connect), so run outside the lock
    return ctor(uri, ec);
}
