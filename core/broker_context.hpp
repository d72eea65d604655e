// filename: core/broker_context.hpp
#pragma once
#include <core/broker.hpp>
#include <core/metrics.hpp>
#include <core/net_config.hpp>
#include <cstdint>
#include <unordered_map>
#include <mutex>
#include <chrono>
#include <set>
#include <string>

struct BanEntry {
    std::chrono::steady_clock::time_point until{};
    int strikes{0};
};

struct QueueDeclaration {
    // publishes above it are clamped; 0 means no limit
    std::uint8_t max_priority{0};
    std::string dead_letter_exchange;
};

// State shared by every session of a daemon. It outlives a BrokerServer, so
// a restarted server keeps the hosted queues.
struct BrokerContext {
    explicit BrokerContext(BrokerPtr backend) : backend(std::move(backend)) {}

    // Peers sending malformed frames are banned after bad_frame_threshold
    // strikes. An expired ban starts a fresh count.
    bool banned(const std::string& ip);
    // true when this strike bans the peer
    bool strike(const std::string& ip);

    Metrics metrics;

    // hosts the queues
    BrokerPtr backend;
    // header names used on the wire
    NetConfig config;
    // how often an idle consumer looks at its queue again
    std::chrono::milliseconds poll_interval{10};

    std::mutex topology_mu;
    std::unordered_map<std::string, QueueDeclaration> declarations;
    // exchange -> bound queues
    std::unordered_map<std::string, std::set<std::string>> bindings;

    std::mutex bad_peers_mu;
    std::unordered_map<std::string, BanEntry> bad_peers;

    int bad_frame_threshold = 3;
    std::chrono::minutes ban_duration{std::chrono::minutes(5)};
};
