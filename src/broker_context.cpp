// filename: src/broker_context.cpp
#include <core/broker_context.hpp>

namespace {

void lift_expired(BanEntry& entry, std::chrono::steady_clock::time_point now) {
    if (entry.until != std::chrono::steady_clock::time_point{} && entry.until <= now) {
        entry.until = {};
        entry.strikes = 0;
    }
}

} // namespace

bool BrokerContext::banned(const std::string& ip) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lk(bad_peers_mu);
    auto it = bad_peers.find(ip);
    if (it == bad_peers.end()) return false;
    lift_expired(it->second, now);
    return it->second.until > now;
}

bool BrokerContext::strike(const std::string& ip) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lk(bad_peers_mu);
    auto& entry = bad_peers[ip];
    lift_expired(entry, now);
    if (++entry.strikes < bad_frame_threshold) return false;
    entry.until = now + ban_duration;
    entry.strikes = 0;
    return true;
}
