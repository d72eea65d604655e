//filename: tests/test_uri_config.cpp
#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "core/net_config.hpp"
#include "core/uri.hpp"
#include <cstdlib>
#include <limits>

TEST(UriTest, ParsesSchemeHostPortAndQuery) {
    Uri u;
    ASSERT_TRUE(parse_uri("jobq://broker.local:5673/vhost?backoff_min_ms=10&connect_attempts=2", u));
    EXPECT_EQ(u.scheme, "jobq");
    EXPECT_EQ(u.host, "broker.local");
    EXPECT_EQ(u.port, "5673");
    EXPECT_EQ(u.path, "/vhost");
    ASSERT_EQ(u.query.size(), 2u);
    EXPECT_EQ(u.query.at("backoff_min_ms"), "10");
    EXPECT_EQ(u.query.at("connect_attempts"), "2");
}

TEST(UriTest, MemorySchemeHasNoAuthority) {
    Uri u;
    ASSERT_TRUE(parse_uri("memory://", u));
    EXPECT_EQ(u.scheme, "memory");
    EXPECT_TRUE(u.host.empty());
    EXPECT_TRUE(u.query.empty());
}

TEST(UriTest, BracketedIpv6Host) {
    Uri u;
    ASSERT_TRUE(parse_uri("jobq://[::1]:9000", u));
    EXPECT_EQ(u.host, "::1");
    EXPECT_EQ(u.port, "9000");
}

TEST(UriTest, RejectsMalformed) {
    Uri u;
    EXPECT_FALSE(parse_uri("no-scheme-here", u));
    EXPECT_FALSE(parse_uri("://host", u));
    EXPECT_FALSE(parse_uri("jobq://host:12ab", u));
    EXPECT_FALSE(parse_uri("jobq://[::1", u));
    EXPECT_FALSE(parse_uri("1abc://host", u));
}

TEST(ParseNumberTest, StrictWithSpacesTrimmed) {
    std::uint64_t n = 0;
    EXPECT_TRUE(parse_uint(" 42 ", n));
    EXPECT_EQ(n, 42u);
    EXPECT_FALSE(parse_uint("", n));
    EXPECT_FALSE(parse_uint("4x", n));
    EXPECT_FALSE(parse_uint("-1", n));

    double d = 0;
    EXPECT_TRUE(parse_double("1.5", d));
    EXPECT_DOUBLE_EQ(d, 1.5);
    EXPECT_FALSE(parse_double("1.5s", d));
}

TEST(ParseNumberTest, WindowFitsInInt) {
    int w = -1;
    EXPECT_TRUE(parse_window("0", w));
    EXPECT_EQ(w, 0);
    EXPECT_TRUE(parse_window("2147483647", w));
    EXPECT_EQ(w, std::numeric_limits<int>::max());

    w = 7;
    EXPECT_FALSE(parse_window("2147483648", w));
    EXPECT_FALSE(parse_window("4294967296", w));
    EXPECT_FALSE(parse_window("-1", w));
    EXPECT_EQ(w, 7);
}

TEST(NetConfigTest, Defaults) {
    NetConfig cfg;
    EXPECT_EQ(cfg.backoff_min, std::chrono::milliseconds(200));
    EXPECT_EQ(cfg.backoff_max, std::chrono::milliseconds(30000));
    EXPECT_DOUBLE_EQ(cfg.backoff_factor, 2.0);
    EXPECT_EQ(cfg.connect_attempts, 5u);
    EXPECT_EQ(cfg.max_reconnect_attempts, 0u);
    EXPECT_EQ(cfg.buried_queue_suffix, ".buriedQueue");
    EXPECT_EQ(cfg.buried_exchange_suffix, ".buriedExchange");
    EXPECT_EQ(cfg.retries_header, "x-retries");
    EXPECT_EQ(cfg.error_header, "x-error-type");
}

TEST(NetConfigTest, QueryOverridesFields) {
    Uri u;
    ASSERT_TRUE(parse_uri("jobq://h:1?backoff_min_ms=5&backoff_max_ms=50&backoff_factor=1.5"
                          "&max_reconnect_attempts=3&buried_timeout_ms=20"
                          "&buried_queue_suffix=.dead&retries_header=x-r", u));
    NetConfig cfg;
    ASSERT_FALSE(apply_query(cfg, u));
    EXPECT_EQ(cfg.backoff_min, std::chrono::milliseconds(5));
    EXPECT_EQ(cfg.backoff_max, std::chrono::milliseconds(50));
    EXPECT_DOUBLE_EQ(cfg.backoff_factor, 1.5);
    EXPECT_EQ(cfg.max_reconnect_attempts, 3u);
    EXPECT_EQ(cfg.buried_timeout, std::chrono::milliseconds(20));
    EXPECT_EQ(cfg.buried_queue_suffix, ".dead");
    EXPECT_EQ(cfg.retries_header, "x-r");
}

TEST(NetConfigTest, BadQueryIsInvalidOption) {
    NetConfig cfg;
    Uri u;
    ASSERT_TRUE(parse_uri("jobq://h:1?backoff_min_ms=soon", u));
    EXPECT_EQ(apply_query(cfg, u), make_error_code(mq_errc::invalid_option));

    ASSERT_TRUE(parse_uri("jobq://h:1?no_such_option=1", u));
    EXPECT_EQ(apply_query(cfg, u), make_error_code(mq_errc::invalid_option));

    ASSERT_TRUE(parse_uri("jobq://h:1?connect_attempts=0", u));
    EXPECT_EQ(apply_query(cfg, u), make_error_code(mq_errc::invalid_option));
}

TEST(NetConfigTest, EnvironmentAppliesAndSkipsMalformed) {
    ::setenv("JOBQ_BACKOFF_MAX_MS", "1234", 1);
    ::setenv("JOBQ_CONNECT_ATTEMPTS", "lots", 1);
    NetConfig cfg;
    apply_env(cfg);
    ::unsetenv("JOBQ_BACKOFF_MAX_MS");
    ::unsetenv("JOBQ_CONNECT_ATTEMPTS");

    EXPECT_EQ(cfg.backoff_max, std::chrono::milliseconds(1234));
    EXPECT_EQ(cfg.connect_attempts, 5u);
}
