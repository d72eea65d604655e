// filename: src/buried_store.cpp
#include <core/buried_store.hpp>
#include <unordered_set>

void BuriedStore::bury(JobPtr job) {
    if (!job) return;
    std::lock_guard<std::mutex> lk(mu_);
    jobs_.push_back(std::move(job));
}

std::vector<JobPtr> BuriedStore::take_matching(const RepublishConditions& conditions) {
    // conditions run unlocked; they may call back into the store
    std::vector<JobPtr> candidates;
    {
        std::lock_guard<std::mutex> lk(mu_);
        candidates.assign(jobs_.begin(), jobs_.end());
    }
    std::unordered_set<const Job*> chosen;
    for (const auto& job : candidates) {
        if (comply(conditions, *job)) chosen.insert(job.get());
    }

    std::vector<JobPtr> taken;
    if (chosen.empty()) return taken;
    std::lock_guard<std::mutex> lk(mu_);
    std::deque<JobPtr> kept;
    for (auto& job : jobs_) {
        // jobs taken by a concurrent call are gone from jobs_ already
        if (chosen.count(job.get())) {
            taken.push_back(std::move(job));
        } else {
            kept.push_back(std::move(job));
        }
    }
    jobs_.swap(kept);
    return taken;
}

std::size_t BuriedStore::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return jobs_.size();
}

std::vector<JobPtr> BuriedStore::snapshot() const {
    std::vector<JobPtr> out;
    std::lock_guard<std::mutex> lk(mu_);
    out.reserve(jobs_.size());
    for (const auto& job : jobs_) out.push_back(job->clone());
    return out;
}
