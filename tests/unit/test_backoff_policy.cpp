// ============================================================================
// LIFELINE - Retry/Backoff Policy Unit Tests
// ============================================================================

#include "lifeline/resilience/backoff_policy.hpp"

#include <gtest/gtest.h>

using namespace lifeline;
using namespace std::chrono_literals;
using resilience::BackoffPolicy;

class BackoffPolicyTest : public ::testing::Test {
protected:
    config::BackoffConfig config_;  // 5 s initial, x2, 30 s cap, 30 attempts
};

// ============================================================================
// Delay Growth
// ============================================================================

TEST_F(BackoffPolicyTest, ExponentialGrowthCapped) {
    BackoffPolicy policy(config_);

    EXPECT_EQ(policy.base_delay(1), 5000ms);
    EXPECT_EQ(policy.base_delay(2), 10000ms);
    EXPECT_EQ(policy.base_delay(3), 20000ms);
    EXPECT_EQ(policy.base_delay(4), 30000ms);
    EXPECT_EQ(policy.base_delay(29), 30000ms);
}

TEST_F(BackoffPolicyTest, HugeAttemptNumberStaysAtCap) {
    BackoffPolicy policy(config_);
    EXPECT_EQ(policy.base_delay(5000), 30000ms);
}

TEST_F(BackoffPolicyTest, TransientFailureWaitsBaseDelayWithoutJitter) {
    BackoffPolicy policy(config_, BackoffPolicy::no_jitter());

    const auto decision = policy.decide(1, FailureClass::Transient);
    EXPECT_FALSE(decision.give_up);
    EXPECT_EQ(decision.wait, 5000ms);
}

// ============================================================================
// Jitter
// ============================================================================

TEST_F(BackoffPolicyTest, JitterScalesByRatio) {
    BackoffPolicy high(config_, [] { return 1.0; });
    BackoffPolicy low(config_, [] { return -1.0; });

    EXPECT_EQ(high.decide(1, FailureClass::Transient).wait, 5500ms);
    EXPECT_EQ(low.decide(1, FailureClass::Transient).wait, 4500ms);
}

TEST_F(BackoffPolicyTest, JitteredDelayNeverExceedsMax) {
    BackoffPolicy policy(config_, [] { return 1.0; });
    EXPECT_EQ(policy.decide(10, FailureClass::Transient).wait, 30000ms);
}

TEST_F(BackoffPolicyTest, OutOfRangeJitterIsClamped) {
    BackoffPolicy policy(config_, [] { return 7.0; });
    EXPECT_EQ(policy.decide(1, FailureClass::Transient).wait, 5500ms);
}

TEST_F(BackoffPolicyTest, RandomJitterStaysInBand) {
    BackoffPolicy policy(config_, BackoffPolicy::random_jitter(12345));

    for (int i = 0; i < 1000; ++i) {
        const auto wait = policy.decide(2, FailureClass::Transient).wait;
        EXPECT_GE(wait, 9000ms);
        EXPECT_LE(wait, 11000ms);
    }
}

TEST_F(BackoffPolicyTest, RandomJitterIsReproducibleFromSeed) {
    auto a = BackoffPolicy::random_jitter(7);
    auto b = BackoffPolicy::random_jitter(7);
    for (int i = 0; i < 16; ++i) {
        EXPECT_DOUBLE_EQ(a(), b());
    }
}

// ============================================================================
// Budget and Failure Classes
// ============================================================================

TEST_F(BackoffPolicyTest, BudgetExhaustedAtMaxAttempts) {
    BackoffPolicy policy(config_);

    EXPECT_EQ(policy.budget(), 30u);
    EXPECT_FALSE(policy.decide(29, FailureClass::Transient).give_up);
    EXPECT_TRUE(policy.decide(30, FailureClass::Transient).give_up);
    EXPECT_TRUE(policy.decide(31, FailureClass::Transient).give_up);
}

TEST_F(BackoffPolicyTest, RejectedAuthenticationNeverRetries) {
    BackoffPolicy policy(config_);
    const auto decision = policy.decide(1, FailureClass::AuthRejected);
    EXPECT_TRUE(decision.give_up);
    EXPECT_EQ(decision.wait, 0ms);
}

TEST_F(BackoffPolicyTest, PendingSecondFactorUsesFixedWait) {
    BackoffPolicy policy(config_, [] { return 1.0; });

    EXPECT_EQ(policy.decide(1, FailureClass::AuthPendingSecondFactor).wait, 60000ms);
    EXPECT_EQ(policy.decide(5, FailureClass::AuthPendingSecondFactor).wait, 60000ms);
}

TEST_F(BackoffPolicyTest, PendingSecondFactorStillConsumesBudget) {
    config_.max_attempts = 3;
    BackoffPolicy policy(config_);
    EXPECT_TRUE(policy.decide(3, FailureClass::AuthPendingSecondFactor).give_up);
}
