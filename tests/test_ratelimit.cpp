/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include <gtest/gtest.h>
#include "wg/internal/ratelimit.hpp"

#include <chrono>
#include <thread>

using wg::internal::TokenBucketMap;

TEST(RateLimitTest, DisabledAlwaysAllows) {
    TokenBucketMap rl;
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(rl.allow("10.0.0.1", 0.0, 0.0));
    }
    EXPECT_EQ(rl.size(), 0u);
}

TEST(RateLimitTest, BurstThenDeny) {
    TokenBucketMap rl;
    // 0.001 tokens/s: no meaningful refill during the test
    EXPECT_TRUE(rl.allow("10.0.0.1", 0.001, 3));
    EXPECT_TRUE(rl.allow("10.0.0.1", 0.001, 3));
    EXPECT_TRUE(rl.allow("10.0.0.1", 0.001, 3));
    EXPECT_FALSE(rl.allow("10.0.0.1", 0.001, 3));
    // Other peers have their own bucket.
    EXPECT_TRUE(rl.allow("10.0.0.2", 0.001, 3));
}

TEST(RateLimitTest, Refills) {
    TokenBucketMap rl;
    EXPECT_TRUE(rl.allow("p", 50.0, 1));
    EXPECT_FALSE(rl.allow("p", 50.0, 1));
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_TRUE(rl.allow("p", 50.0, 1));
}

TEST(RateLimitTest, GcDropsIdleBuckets) {
    TokenBucketMap rl;
    EXPECT_TRUE(rl.allow("a", 1.0, 1.0));
    EXPECT_EQ(rl.size(), 1u);
    rl.gc(std::chrono::seconds(60));
    EXPECT_EQ(rl.size(), 1u);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    rl.gc(std::chrono::seconds(0));
    EXPECT_EQ(rl.size(), 0u);
}
