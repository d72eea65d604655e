// filename: core/metrics.hpp
#pragma once
#include <atomic>
#include <cstdint>

// Daemon counters, read by tests and logged on shutdown.
struct Metrics {
    std::atomic<uint64_t> published{0};
    std::atomic<uint64_t> delivered{0};
    std::atomic<uint64_t> acked{0};
    std::atomic<uint64_t> rejected{0};
    std::atomic<uint64_t> dead_lettered{0};
    std::atomic<uint64_t> malformed_frames{0};
};
