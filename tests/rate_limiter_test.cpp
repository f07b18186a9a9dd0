/**
 * Tests for the shared request limiter
 */

#include <chrono>
#include <thread>
#include <vector>
#include <gtest/gtest.h>

#include "ohlcv_ingest/common/cancellation.h"
#include "ohlcv_ingest/common/errors.h"
#include "ohlcv_ingest/data/rate_limiter.h"

using namespace ohlcv_ingest;
using Clock = std::chrono::steady_clock;

TEST(RateLimiterTest, SpacesSequentialRequests) {
    data::RateLimiter limiter(std::chrono::milliseconds(20));
    common::CancellationToken token;

    auto start = Clock::now();
    for (int i = 0; i < 4; ++i) {
        limiter.acquire(token);
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    // First slot is immediate, the next three wait 20 ms each
    EXPECT_GE(elapsed.count(), 55);
    EXPECT_EQ(limiter.acquired(), 4u);
}

TEST(RateLimiterTest, SpacesRequestsAcrossThreads) {
    data::RateLimiter limiter(std::chrono::milliseconds(15));
    common::CancellationToken token;

    auto start = Clock::now();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 2; ++i) {
                limiter.acquire(token);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    EXPECT_GE(elapsed.count(), 7 * 15 - 5);
    EXPECT_EQ(limiter.acquired(), 8u);
}

TEST(RateLimiterTest, ZeroSpacingNeverWaits) {
    data::RateLimiter limiter(std::chrono::milliseconds(0));
    common::CancellationToken token;

    auto start = Clock::now();
    for (int i = 0; i < 100; ++i) {
        limiter.acquire(token);
    }
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count(), 50);
}

TEST(RateLimiterTest, CancelledTokenThrows) {
    data::RateLimiter limiter(std::chrono::milliseconds(10));
    common::CancellationToken token;
    token.cancel();
    EXPECT_THROW(limiter.acquire(token), CancelledError);
}

TEST(RateLimiterTest, CancelWakesWaiter) {
    data::RateLimiter limiter(std::chrono::seconds(10));
    common::CancellationToken token;
    limiter.acquire(token);

    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        token.cancel();
    });

    auto start = Clock::now();
    EXPECT_THROW(limiter.acquire(token), CancelledError);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - start).count(), 5);
    canceller.join();
}
