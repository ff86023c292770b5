/**
 * @file test_reconnect_policy.cpp
 * @brief Backoff schedule for relay reconnection
 */

#include <gtest/gtest.h>
#include "ReconnectPolicy.h"

using Tessera::Signaling::ReconnectPolicy;
using std::chrono::milliseconds;

TEST(ReconnectPolicyTest, BackoffDoublesUntilCap) {
    ReconnectPolicy policy;
    policy.baseDelay = milliseconds(100);
    policy.maxDelay = milliseconds(1000);
    policy.jitter = milliseconds(0);

    EXPECT_EQ(policy.backoff(0), milliseconds(100));
    EXPECT_EQ(policy.backoff(1), milliseconds(100));
    EXPECT_EQ(policy.backoff(2), milliseconds(200));
    EXPECT_EQ(policy.backoff(3), milliseconds(400));
    EXPECT_EQ(policy.backoff(4), milliseconds(800));
    EXPECT_EQ(policy.backoff(5), milliseconds(1000));
    EXPECT_EQ(policy.backoff(1000), milliseconds(1000));
    EXPECT_EQ(policy.nextDelay(3), milliseconds(400));
}

TEST(ReconnectPolicyTest, JitterStaysWithinBounds) {
    ReconnectPolicy policy;
    policy.baseDelay = milliseconds(100);
    policy.maxDelay = milliseconds(10000);
    policy.jitter = milliseconds(50);

    for (int i = 0; i < 200; ++i) {
        auto delay = policy.nextDelay(2);
        EXPECT_GE(delay, milliseconds(200));
        EXPECT_LE(delay, milliseconds(250));
    }
}

TEST(ReconnectPolicyTest, JitterNeverExceedsCap) {
    ReconnectPolicy policy;
    policy.baseDelay = milliseconds(100);
    policy.maxDelay = milliseconds(300);
    policy.jitter = milliseconds(1000);

    for (int i = 0; i < 200; ++i) {
        EXPECT_LE(policy.nextDelay(10), milliseconds(300));
    }
}
