#include <gtest/gtest.h>

#include "capsync/upload/retry_policy.hpp"

using namespace capsync::core;
using capsync::upload::RetryPolicy;
using capsync::upload::backoff_delay_ms;
using capsync::upload::retry_allowed;

TEST(UploadRetryPolicy, BackoffDoublesUpToCap) {
    const RetryPolicy p{.max_attempts = 10, .base_delay_ms = 1'000, .max_delay_ms = 60'000};
    EXPECT_EQ(backoff_delay_ms(p, 0), 0);
    EXPECT_EQ(backoff_delay_ms(p, 1), 1'000);
    EXPECT_EQ(backoff_delay_ms(p, 2), 2'000);
    EXPECT_EQ(backoff_delay_ms(p, 3), 4'000);
    EXPECT_EQ(backoff_delay_ms(p, 6), 32'000);
    EXPECT_EQ(backoff_delay_ms(p, 7), 60'000);
    EXPECT_EQ(backoff_delay_ms(p, 4'000'000'000u), 60'000);
}

TEST(UploadRetryPolicy, ZeroBaseMeansNoWait) {
    const RetryPolicy p{.max_attempts = 3, .base_delay_ms = 0, .max_delay_ms = 100};
    EXPECT_EQ(backoff_delay_ms(p, 5), 0);
}

TEST(UploadRetryPolicy, RetryOnlyTransientFailuresWithinBudget) {
    const RetryPolicy p{.max_attempts = 3, .base_delay_ms = 10, .max_delay_ms = 100};
    const Status network = make_status(StatusDomain::Transport, StatusCode::Network);
    const Status throttled = make_status(StatusDomain::Transport, StatusCode::Throttled);
    const Status rejected = make_status(StatusDomain::Transport, StatusCode::Rejected);
    const Status mismatch = make_status(StatusDomain::Transport, StatusCode::ChecksumMismatch);

    EXPECT_TRUE(retry_allowed(p, 1, network));
    EXPECT_TRUE(retry_allowed(p, 2, throttled));
    EXPECT_FALSE(retry_allowed(p, 3, network));
    EXPECT_FALSE(retry_allowed(p, 1, rejected));
    EXPECT_FALSE(retry_allowed(p, 1, mismatch));
    EXPECT_FALSE(retry_allowed(p, 1, ok_status()));
}

TEST(UploadRetryPolicy, IoIsTransientOnlyOnTheTransportSide) {
    const RetryPolicy p{};
    EXPECT_TRUE(retry_allowed(p, 1, make_status(StatusDomain::Transport, StatusCode::Io, 5)));
    EXPECT_FALSE(retry_allowed(p, 1, make_status(StatusDomain::Store, StatusCode::Io, 5)));
}

TEST(UploadRetryPolicy, JitterSpreadsDelayAroundBackoff) {
    RetryPolicy p{.max_attempts = 5, .base_delay_ms = 1'000, .max_delay_ms = 60'000};
    const i64 delay = backoff_delay_ms(p, 3);
    ASSERT_EQ(delay, 4'000);
    EXPECT_EQ(capsync::upload::jittered_delay_ms(p, delay, 0.9), 4'000);

    p.jitter = 0.2;
    EXPECT_EQ(capsync::upload::jittered_delay_ms(p, delay, 0.0), 3'200);
    EXPECT_EQ(capsync::upload::jittered_delay_ms(p, delay, 0.5), 4'000);
    EXPECT_EQ(capsync::upload::jittered_delay_ms(p, delay, 1.0), 4'800);
    EXPECT_EQ(capsync::upload::jittered_delay_ms(p, delay, 7.0), 4'800);
    EXPECT_EQ(capsync::upload::jittered_delay_ms(p, 0, 1.0), 0);
}
