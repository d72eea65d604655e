// filename: core/buried_store.hpp
#pragma once
#include <core/job.hpp>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

// BuriedStore: jobs rejected without requeue, kept in burial order until a
// RepublishBuried call takes them back. Thread-safe.
class BuriedStore {
public:
    void bury(JobPtr job);

    // Removes and returns the jobs matching every condition, in burial
    // order. Non-matching jobs keep their relative order.
    std::vector<JobPtr> take_matching(const RepublishConditions& conditions);

    std::size_t size() const;

    // copies for inspection; the stored jobs stay buried
    std::vector<JobPtr> snapshot() const;

private:
    mutable std::mutex mu_;
    std::deque<JobPtr> jobs_;
};
