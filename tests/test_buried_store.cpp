//filename: tests/test_buried_store.cpp
#include <gtest/gtest.h>
#include "core/buried_store.hpp"

namespace {

JobPtr job_with_error(const std::string& raw, const std::string& error_type) {
    auto job = Job::make();
    job->raw = raw;
    job->error_type = error_type;
    return job;
}

} // namespace

TEST(BuriedStoreTest, TakeAllWithoutConditions) {
    BuriedStore store;
    store.bury(job_with_error("a", "x"));
    store.bury(job_with_error("b", "y"));
    auto taken = store.take_matching({});
    ASSERT_EQ(taken.size(), 2u);
    EXPECT_EQ(taken[0]->raw, "a");
    EXPECT_EQ(taken[1]->raw, "b");
    EXPECT_EQ(store.size(), 0u);
}

TEST(BuriedStoreTest, ConditionsAreAnded) {
    BuriedStore store;
    store.bury(job_with_error("a", "timeout"));
    store.bury(job_with_error("bb", "timeout"));
    store.bury(job_with_error("cc", "crash"));

    RepublishConditions conds{
        [](const Job& j) { return j.error_type == "timeout"; },
        [](const Job& j) { return j.raw.size() == 2; },
    };
    auto taken = store.take_matching(conds);
    ASSERT_EQ(taken.size(), 1u);
    EXPECT_EQ(taken[0]->raw, "bb");

    auto left = store.snapshot();
    ASSERT_EQ(left.size(), 2u);
    EXPECT_EQ(left[0]->raw, "a");
    EXPECT_EQ(left[1]->raw, "cc");
}

TEST(BuriedStoreTest, SnapshotDoesNotRemove) {
    BuriedStore store;
    store.bury(job_with_error("a", "x"));
    auto snap = store.snapshot();
    ASSERT_EQ(snap.size(), 1u);
    snap[0]->raw = "changed";
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.snapshot()[0]->raw, "a");
}

TEST(BuriedStoreTest, NullJobIgnored) {
    BuriedStore store;
    store.bury(nullptr);
    EXPECT_EQ(store.size(), 0u);
}

TEST(BuriedStoreTest, ConditionMayLookAtTheStore) {
    BuriedStore store;
    store.bury(job_with_error("a", "x"));
    store.bury(job_with_error("b", "y"));

    std::size_t seen = 0;
    auto taken = store.take_matching({[&](const Job& j) {
        seen = store.size();
        return j.error_type == "y";
    }});
    EXPECT_EQ(seen, 2u);
    ASSERT_EQ(taken.size(), 1u);
    EXPECT_EQ(taken[0]->raw, "b");
    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.snapshot()[0]->raw, "a");
}

TEST(BuriedStoreTest, JobBuriedDuringScanStays) {
    BuriedStore store;
    store.bury(job_with_error("a", "x"));

    auto taken = store.take_matching({[&](const Job& j) {
        if (j.raw == "a") store.bury(job_with_error("late", "x"));
        return true;
    }});
    ASSERT_EQ(taken.size(), 1u);
    EXPECT_EQ(taken[0]->raw, "a");
    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.snapshot()[0]->raw, "late");
}
