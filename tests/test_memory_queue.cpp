//filename: tests/test_memory_queue.cpp
#include <gtest/gtest.h>
#include "core/broker_registry.hpp"
#include "core/memory_broker.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace {

JobPtr text_job(const std::string& body, Priority p = Priority::normal) {
    auto job = Job::make();
    job->set_priority(p);
    EXPECT_FALSE(job->encode(body));
    return job;
}

struct MemoryFixture : ::testing::Test {
    BrokerPtr open(const std::string& uri) {
        boost::system::error_code ec;
        auto broker = registry.make_broker(uri, ec);
        EXPECT_FALSE(ec) << ec.message();
        return broker;
    }

    QueuePtr queue(const BrokerPtr& broker, const std::string& name) {
        boost::system::error_code ec;
        auto q = broker->queue(name, ec);
        EXPECT_FALSE(ec) << ec.message();
        return q;
    }

    BrokerRegistry registry = BrokerRegistry::with_default_backends();
};

} // namespace

TEST_F(MemoryFixture, SameNameSameQueue) {
    auto broker = open("memory://");
    EXPECT_EQ(queue(broker, "a"), queue(broker, "a"));
    EXPECT_NE(queue(broker, "a"), queue(broker, "b"));
}

TEST_F(MemoryFixture, EmptyJobsAreRefused) {
    auto q = queue(open("memory://"), "q");
    auto empty = Job::make();
    EXPECT_EQ(q->publish(nullptr), make_error_code(mq_errc::empty_job));
    EXPECT_EQ(q->publish(empty), make_error_code(mq_errc::empty_job));
    EXPECT_EQ(q->publish_delayed(nullptr, std::chrono::milliseconds(10)),
              make_error_code(mq_errc::empty_job));
    EXPECT_EQ(q->publish_delayed(empty, std::chrono::milliseconds(10)),
              make_error_code(mq_errc::empty_job));
}

TEST_F(MemoryFixture, PublishThenConsumeRoundTrip) {
    auto q = queue(open("memoryfinite://"), "q");
    auto job = text_job("hello");
    job->retries = 2;
    job->error_type = "none";
    ASSERT_FALSE(q->publish(job));

    boost::system::error_code ec;
    auto it = q->consume(0, ec);
    ASSERT_FALSE(ec);
    auto got = it->next(ec);
    ASSERT_FALSE(ec);
    std::string body;
    ASSERT_FALSE(got->decode(body));
    EXPECT_EQ(body, "hello");
    EXPECT_EQ(got->id, job->id);
    EXPECT_EQ(got->retries, 2);
    EXPECT_EQ(got->error_type, "none");
    EXPECT_TRUE(got->acknowledger);
    EXPECT_FALSE(got->ack());
}

TEST_F(MemoryFixture, UrgentJobsOvertakeLowOnes) {
    const int n = 5;
    auto q = queue(open("memoryfinite://"), "prio");
    for (int i = 0; i < n; ++i) ASSERT_FALSE(q->publish(text_job("low", Priority::low)));
    for (int i = 0; i < n; ++i) ASSERT_FALSE(q->publish(text_job("urgent", Priority::urgent)));

    boost::system::error_code ec;
    auto it = q->consume(0, ec);
    ASSERT_FALSE(ec);
    int first_half = 0;
    int second_half = 0;
    for (int i = 0; i < 2 * n; ++i) {
        auto job = it->next(ec);
        ASSERT_FALSE(ec) << ec.message();
        (i < n ? first_half : second_half) += static_cast<int>(job->priority);
        ASSERT_FALSE(job->ack());
    }
    EXPECT_EQ(first_half, n * static_cast<int>(Priority::urgent));
    EXPECT_EQ(second_half, n * static_cast<int>(Priority::low));

    it->next(ec);
    EXPECT_EQ(ec, make_error_code(mq_errc::end_of_stream));
}

TEST_F(MemoryFixture, FifoWithinOnePriority) {
    auto q = queue(open("memoryfinite://"), "fifo");
    for (int i = 0; i < 5; ++i) ASSERT_FALSE(q->publish(text_job(std::to_string(i))));

    boost::system::error_code ec;
    auto it = q->consume(0, ec);
    for (int i = 0; i < 5; ++i) {
        auto job = it->next(ec);
        ASSERT_FALSE(ec);
        EXPECT_EQ(job->raw, std::to_string(i));
        job->ack();
    }
}

TEST_F(MemoryFixture, WindowBoundsUnsettledDeliveries) {
    auto q = queue(open("memory://?poll_ms=5"), "window");
    for (int i = 0; i < 10; ++i) ASSERT_FALSE(q->publish(text_job("j")));

    boost::system::error_code ec;
    auto it = q->consume(3, ec);
    ASSERT_FALSE(ec);
    auto mit = std::dynamic_pointer_cast<MemoryJobIter>(it);
    ASSERT_TRUE(mit);

    std::vector<JobPtr> held;
    for (int i = 0; i < 3; ++i) {
        held.push_back(it->next(ec));
        ASSERT_FALSE(ec);
    }
    EXPECT_EQ(mit->in_flight(), 3u);

    std::atomic<bool> fourth{false};
    JobPtr extra;
    std::thread t([&] {
        boost::system::error_code tec;
        extra = it->next(tec);
        if (!tec) fourth = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    EXPECT_FALSE(fourth.load());
    EXPECT_LE(mit->in_flight(), 3u);

    ASSERT_FALSE(held[0]->ack());
    t.join();
    EXPECT_TRUE(fourth.load());
    EXPECT_EQ(mit->in_flight(), 3u);

    // a reject frees the slot just like an ack
    ASSERT_FALSE(held[1]->reject(true));
    EXPECT_EQ(mit->in_flight(), 2u);
}

TEST_F(MemoryFixture, TenConcurrentConsumersGetDistinctJobs) {
    auto q = queue(open("memory://?poll_ms=5"), "fanout");
    for (int i = 0; i < 10; ++i) ASSERT_FALSE(q->publish(text_job("job" + std::to_string(i))));

    boost::system::error_code ec;
    auto it = q->consume(10, ec);
    ASSERT_FALSE(ec);

    std::mutex mu;
    std::set<std::string> ids;
    std::atomic<int> failures{0};
    const auto start = std::chrono::steady_clock::now();
    std::vector<std::thread> consumers;
    for (int i = 0; i < 10; ++i) {
        consumers.emplace_back([&] {
            boost::system::error_code tec;
            auto job = it->next(tec);
            if (tec) { ++failures; return; }
            std::lock_guard<std::mutex> lk(mu);
            ids.insert(job->id);
        });
    }
    for (auto& t : consumers) t.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(ids.size(), 10u);
}

TEST_F(MemoryFixture, IteratorsTrackTheirOwnLastDelivery) {
    auto q = queue(open("memoryfinite://"), "seq");
    for (int i = 0; i < 3; ++i) ASSERT_FALSE(q->publish(text_job("j")));

    boost::system::error_code ec;
    auto a = std::dynamic_pointer_cast<MemoryJobIter>(q->consume(0, ec));
    auto b = std::dynamic_pointer_cast<MemoryJobIter>(q->consume(0, ec));
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->last_delivered(), 0u);

    a->next(ec)->ack();
    b->next(ec)->ack();
    a->next(ec)->ack();
    EXPECT_EQ(a->last_delivered(), 3u);
    EXPECT_EQ(b->last_delivered(), 2u);
}

TEST_F(MemoryFixture, DelayedJobAppearsOnlyAfterDelay) {
    auto q = queue(open("memory://?poll_ms=5"), "delayed");
    auto mq = std::dynamic_pointer_cast<MemoryQueue>(q);
    ASSERT_TRUE(mq);

    const auto start = std::chrono::steady_clock::now();
    ASSERT_FALSE(q->publish_delayed(text_job("later"), std::chrono::milliseconds(200)));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(mq->pending(), 0u);

    boost::system::error_code ec;
    auto it = q->consume(0, ec);
    auto job = it->next(ec);
    ASSERT_FALSE(ec);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(200));
    EXPECT_EQ(job->raw, "later");
    job->ack();
}

TEST_F(MemoryFixture, FailedTransactionPublishesNothing) {
    auto q = queue(open("memoryfinite://"), "tx");
    auto mq = std::dynamic_pointer_cast<MemoryQueue>(q);

    auto ec = q->transaction([](Queue& tx) {
        if (auto e = tx.publish(text_job("a"))) return e;
        if (auto e = tx.publish(text_job("b"))) return e;
        return make_error_code(mq_errc::payload_mismatch);
    });
    EXPECT_EQ(ec, make_error_code(mq_errc::payload_mismatch));
    EXPECT_EQ(mq->pending(), 0u);

    // an invalid staged publish aborts as well
    ec = q->transaction([](Queue& tx) {
        if (auto e = tx.publish(text_job("a"))) return e;
        return tx.publish(Job::make());
    });
    EXPECT_EQ(ec, make_error_code(mq_errc::empty_job));
    EXPECT_EQ(mq->pending(), 0u);
}

TEST_F(MemoryFixture, SuccessfulTransactionPublishesEverything) {
    auto q = queue(open("memoryfinite://"), "tx");
    auto mq = std::dynamic_pointer_cast<MemoryQueue>(q);

    auto ec = q->transaction([](Queue& tx) {
        for (int i = 0; i < 3; ++i) {
            if (auto e = tx.publish(text_job(std::to_string(i)))) return e;
        }
        return boost::system::error_code{};
    });
    ASSERT_FALSE(ec);
    EXPECT_EQ(mq->pending(), 3u);

    EXPECT_FALSE(q->transaction(nullptr));
    EXPECT_EQ(mq->pending(), 3u);
}

TEST_F(MemoryFixture, StagingQueueRefusesNestedWork) {
    auto q = queue(open("memory://"), "tx");
    boost::system::error_code consume_ec;
    boost::system::error_code nested_ec;
    boost::system::error_code republish_ec;
    auto ec = q->transaction([&](Queue& tx) {
        tx.consume(1, consume_ec);
        nested_ec = tx.transaction([](Queue&) { return boost::system::error_code{}; });
        republish_ec = tx.republish_buried();
        return boost::system::error_code{};
    });
    EXPECT_FALSE(ec);
    EXPECT_EQ(consume_ec, make_error_code(mq_errc::transactions_not_supported));
    EXPECT_EQ(nested_ec, make_error_code(mq_errc::transactions_not_supported));
    EXPECT_EQ(republish_ec, make_error_code(mq_errc::transactions_not_supported));
}

TEST_F(MemoryFixture, RequeueRedeliversWithUpdatedMetadata) {
    auto q = queue(open("memoryfinite://"), "requeue");
    ASSERT_FALSE(q->publish(text_job("again")));

    boost::system::error_code ec;
    auto it = q->consume(1, ec);
    auto job = it->next(ec);
    ASSERT_FALSE(ec);
    job->retries = 1;
    ASSERT_FALSE(job->reject(true));

    auto again = it->next(ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(again->id, job->id);
    EXPECT_EQ(again->retries, 1);
    again->ack();
}

TEST_F(MemoryFixture, RepublishBuriedKeepsBurialOrder) {
    auto q = queue(open("memoryfinite://"), "buried");
    auto mq = std::dynamic_pointer_cast<MemoryQueue>(q);
    for (const char* body : {"a", "b", "c", "d", "e"}) ASSERT_FALSE(q->publish(text_job(body)));

    boost::system::error_code ec;
    auto it = q->consume(0, ec);
    for (int i = 0; i < 5; ++i) {
        auto job = it->next(ec);
        ASSERT_FALSE(ec);
        job->error_type = (job->raw == "b" || job->raw == "d") ? "fatal" : "transient";
        ASSERT_FALSE(job->reject(false));
    }
    EXPECT_EQ(mq->pending(), 0u);
    EXPECT_EQ(mq->buried(), 5u);

    ASSERT_FALSE(q->republish_buried({[](const Job& j) { return j.error_type == "transient"; }}));
    EXPECT_EQ(mq->pending(), 3u);

    std::vector<std::string> still_buried;
    for (const auto& job : mq->buried_jobs()) still_buried.push_back(job->raw);
    EXPECT_EQ(still_buried, (std::vector<std::string>{"b", "d"}));

    std::vector<std::string> bodies;
    for (int i = 0; i < 3; ++i) {
        auto job = it->next(ec);
        ASSERT_FALSE(ec);
        EXPECT_TRUE(job->error_type.empty());
        bodies.push_back(job->raw);
        job->ack();
    }
    EXPECT_EQ(bodies, (std::vector<std::string>{"a", "c", "e"}));

    ASSERT_FALSE(q->republish_buried());
    EXPECT_EQ(mq->buried(), 0u);
    bodies.clear();
    for (int i = 0; i < 2; ++i) {
        auto job = it->next(ec);
        ASSERT_FALSE(ec);
        bodies.push_back(job->raw);
        job->ack();
    }
    EXPECT_EQ(bodies, (std::vector<std::string>{"b", "d"}));
    EXPECT_FALSE(it->next(ec));
    EXPECT_EQ(ec, make_error_code(mq_errc::end_of_stream));
}

TEST_F(MemoryFixture, RepublishConditionMayInspectTheQueue) {
    auto q = queue(open("memoryfinite://"), "inspect");
    auto mq = std::dynamic_pointer_cast<MemoryQueue>(q);
    ASSERT_FALSE(q->publish(text_job("x")));

    boost::system::error_code ec;
    auto it = q->consume(0, ec);
    auto job = it->next(ec);
    ASSERT_FALSE(ec);
    ASSERT_FALSE(job->reject(false));

    std::size_t seen = 0;
    ASSERT_FALSE(q->republish_buried({[&](const Job&) {
        seen = mq->buried();
        return true;
    }}));
    EXPECT_EQ(seen, 1u);
    EXPECT_EQ(mq->buried(), 0u);
    EXPECT_EQ(mq->pending(), 1u);
}

TEST_F(MemoryFixture, TryNextNeverBlocks) {
    auto q = queue(open("memory://"), "poll");
    boost::system::error_code ec;
    auto it = q->consume(1, ec);
    ASSERT_FALSE(ec);

    EXPECT_FALSE(it->try_next(ec));
    EXPECT_FALSE(ec);

    ASSERT_FALSE(q->publish(text_job("x")));
    ASSERT_FALSE(q->publish(text_job("y")));
    auto first = it->try_next(ec);
    ASSERT_TRUE(first);
    EXPECT_EQ(first->raw, "x");

    // window of one is taken
    EXPECT_FALSE(it->try_next(ec));
    EXPECT_FALSE(ec);

    ASSERT_FALSE(first->ack());
    auto second = it->try_next(ec);
    ASSERT_TRUE(second);
    EXPECT_EQ(second->raw, "y");
    ASSERT_FALSE(second->ack());

    ASSERT_FALSE(it->close());
    EXPECT_FALSE(it->try_next(ec));
    EXPECT_EQ(ec, make_error_code(mq_errc::already_closed));
}

TEST_F(MemoryFixture, TryNextOnDrainedFiniteQueue) {
    auto q = queue(open("memoryfinite://"), "drained");
    boost::system::error_code ec;
    auto it = q->consume(0, ec);
    EXPECT_FALSE(it->try_next(ec));
    EXPECT_EQ(ec, make_error_code(mq_errc::end_of_stream));
}

TEST_F(MemoryFixture, SecondDispositionFails) {
    auto q = queue(open("memoryfinite://"), "double");
    ASSERT_FALSE(q->publish(text_job("x")));
    ASSERT_FALSE(q->publish(text_job("y")));

    boost::system::error_code ec;
    auto it = q->consume(0, ec);
    auto job = it->next(ec);
    ASSERT_FALSE(job->ack());
    EXPECT_EQ(job->ack(), make_error_code(mq_errc::cannot_acknowledge));
    EXPECT_EQ(job->reject(true), make_error_code(mq_errc::cannot_acknowledge));

    auto other = it->next(ec);
    ASSERT_FALSE(other->reject(false));
    EXPECT_EQ(other->ack(), make_error_code(mq_errc::cannot_acknowledge));
}

TEST_F(MemoryFixture, CloseWakesBlockedNext) {
    auto q = queue(open("memory://?poll_ms=5"), "close");
    boost::system::error_code ec;
    auto it = q->consume(0, ec);

    boost::system::error_code blocked_ec;
    JobPtr blocked_job = text_job("sentinel");
    std::thread t([&] { blocked_job = it->next(blocked_ec); });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(it->close());
    t.join();

    EXPECT_EQ(blocked_ec, make_error_code(mq_errc::already_closed));
    EXPECT_EQ(blocked_job, nullptr);

    ASSERT_FALSE(q->publish(text_job("late")));
    auto after = it->next(ec);
    EXPECT_EQ(ec, make_error_code(mq_errc::already_closed));
    EXPECT_EQ(after, nullptr);
    EXPECT_FALSE(it->close());
}

TEST_F(MemoryFixture, CloseWakesNextBlockedOnWindow) {
    auto q = queue(open("memory://?poll_ms=5"), "close-window");
    ASSERT_FALSE(q->publish(text_job("a")));
    ASSERT_FALSE(q->publish(text_job("b")));
    boost::system::error_code ec;
    auto it = q->consume(1, ec);
    auto held = it->next(ec);
    ASSERT_FALSE(ec);

    boost::system::error_code blocked_ec;
    std::thread t([&] { it->next(blocked_ec); });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    it->close();
    t.join();
    EXPECT_EQ(blocked_ec, make_error_code(mq_errc::already_closed));
    EXPECT_FALSE(held->ack());
}

TEST_F(MemoryFixture, FiniteIteratorReportsEndOfStream) {
    auto q = queue(open("memoryfinite://"), "finite");
    boost::system::error_code ec;
    auto it = q->consume(0, ec);
    auto job = it->next(ec);
    EXPECT_EQ(ec, make_error_code(mq_errc::end_of_stream));
    EXPECT_EQ(job, nullptr);
}

TEST_F(MemoryFixture, BrokerCloseClosesEverything) {
    auto broker = open("memory://?poll_ms=5");
    auto q = queue(broker, "q");
    boost::system::error_code ec;
    auto it = q->consume(0, ec);

    boost::system::error_code blocked_ec;
    std::thread t([&] { it->next(blocked_ec); });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(broker->close());
    t.join();
    EXPECT_EQ(blocked_ec, make_error_code(mq_errc::already_closed));

    broker->queue("q", ec);
    EXPECT_EQ(ec, make_error_code(mq_errc::already_closed));
    EXPECT_EQ(q->publish_delayed(text_job("x"), std::chrono::milliseconds(10)),
              make_error_code(mq_errc::already_closed));
    EXPECT_FALSE(broker->close());
}

TEST(RegistryTest, UnknownSchemeAndBadUri) {
    auto registry = BrokerRegistry::with_default_backends();
    boost::system::error_code ec;
    EXPECT_EQ(registry.make_broker("kafka://localhost:9092", ec), nullptr);
    EXPECT_EQ(ec, make_error_code(mq_errc::unsupported_scheme));

    EXPECT_EQ(registry.make_broker("not a uri", ec), nullptr);
    EXPECT_EQ(ec, make_error_code(mq_errc::invalid_uri));

    EXPECT_EQ(registry.make_broker("memory://?poll_ms=fast", ec), nullptr);
    EXPECT_EQ(ec, make_error_code(mq_errc::invalid_option));

    EXPECT_EQ(registry.make_broker("jobq://", ec), nullptr);
    EXPECT_EQ(ec, make_error_code(mq_errc::invalid_uri));
}

TEST(RegistryTest, DefaultSchemesAndCustomRegistration) {
    auto registry = BrokerRegistry::with_default_backends();
    EXPECT_TRUE(registry.has_scheme("memory"));
    EXPECT_TRUE(registry.has_scheme("memoryfinite"));
    EXPECT_TRUE(registry.has_scheme("jobq"));
    EXPECT_FALSE(registry.has_scheme("custom"));

    std::string seen_host;
    registry.register_scheme("custom", [&seen_host](const Uri& uri, boost::system::error_code& ec) {
        seen_host = uri.host;
        ec.clear();
        return BrokerPtr(std::make_shared<MemoryBroker>());
    });
    boost::system::error_code ec;
    auto broker = registry.make_broker("custom://somewhere:1", ec);
    ASSERT_FALSE(ec);
    EXPECT_TRUE(broker);
    EXPECT_EQ(seen_host, "somewhere");
    EXPECT_EQ(registry.schemes().size(), 4u);

    // a separate registry is unaffected
    auto other = BrokerRegistry::with_default_backends();
    EXPECT_FALSE(other.has_scheme("custom"));
}
