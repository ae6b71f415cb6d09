#include <gtest/gtest.h>

#include "circuit_breaker.hpp"
#include "fakes.hpp"

class CircuitBreakerTest : public ::testing::Test {
    protected:
        ManualClock clock_;
        std::shared_ptr<RecordingMetrics> metrics_ = std::make_shared<RecordingMetrics>();
        CircuitBreaker breaker_{0.5, Millis(30'000), clock_.clock(), metrics_};
};

TEST_F(CircuitBreakerTest, StaysClosedBelowMinimumAttempts) {
    for (int i = 0; i < 9; ++i) {
        breaker_.record_failure();
    }
    EXPECT_FALSE(breaker_.is_open());
    breaker_.record_failure();
    EXPECT_TRUE(breaker_.is_open());
    EXPECT_EQ(metrics_->count("circuit_breaker_opened"), 1u);
}

TEST_F(CircuitBreakerTest, OpensWhenFailureRateReachesThreshold) {
    for (int i = 0; i < 5; ++i) {
        breaker_.record_success();
    }
    for (int i = 0; i < 6; ++i) {
        breaker_.record_failure();
    }
    EXPECT_TRUE(breaker_.is_open());
    const auto state = breaker_.snapshot();
    EXPECT_EQ(state.failures, 6u);
    EXPECT_EQ(state.successes, 5u);
    EXPECT_GT(state.failure_rate(), 0.5);
}

TEST_F(CircuitBreakerTest, TripIsNoticedAfterTrailingSuccesses) {
    for (int i = 0; i < 6; ++i) {
        breaker_.record_failure();
    }
    for (int i = 0; i < 4; ++i) {
        breaker_.record_success();
    }
    EXPECT_TRUE(breaker_.is_open());
}

TEST_F(CircuitBreakerTest, StaysClosedBelowThreshold) {
    for (int i = 0; i < 6; ++i) {
        breaker_.record_success();
    }
    for (int i = 0; i < 4; ++i) {
        breaker_.record_failure();
    }
    EXPECT_FALSE(breaker_.is_open());
}

TEST_F(CircuitBreakerTest, ResetsAfterCoolDown) {
    for (int i = 0; i < 10; ++i) {
        breaker_.record_failure();
    }
    ASSERT_TRUE(breaker_.is_open());

    clock_.advance(29'000);
    EXPECT_TRUE(breaker_.is_open());

    clock_.advance(1'001);
    EXPECT_FALSE(breaker_.is_open());
    const auto state = breaker_.snapshot();
    EXPECT_FALSE(state.is_open);
    EXPECT_EQ(state.failures, 0u);
    EXPECT_EQ(state.successes, 0u);
    EXPECT_EQ(metrics_->count("circuit_breaker_reset"), 1u);
}

TEST_F(CircuitBreakerTest, CountersAreRescaledPastLimit) {
    breaker_.record_failure();
    breaker_.record_failure();
    for (int i = 0; i < 1'001; ++i) {
        breaker_.record_success();
    }
    const auto state = breaker_.snapshot();
    EXPECT_LE(state.successes, BREAKER_RESCALE_LIMIT);
    EXPECT_EQ(state.successes, 500u);
    EXPECT_EQ(state.failures, 1u);
}
