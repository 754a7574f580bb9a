#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../../src/limiter/rate_limiter.hpp"

using namespace Reader::Limiter;
using namespace std::chrono_literals;

namespace {
RateLimiterConfig make_config(int capacity, std::chrono::seconds window, size_t max_clients = 100) {
    RateLimiterConfig config;
    config.capacity    = capacity;
    config.window      = window;
    config.max_clients = max_clients;
    return config;
}
}  // namespace

TEST(RateLimiterTest, TwentyFirstRequestIsDenied) {
    RateLimiter limiter;
    auto        now = RateLimiter::Clock::now();

    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(limiter.admit("10.0.0.1", now + std::chrono::milliseconds(i)).allowed) << i;
    }
    Admission denied = limiter.admit("10.0.0.1", now + 1s);
    EXPECT_FALSE(denied.allowed);
    EXPECT_GT(denied.retry_after_seconds, 0);
    EXPECT_LE(denied.retry_after_seconds, 60);
}

TEST(RateLimiterTest, RetryAfterRoundsUp) {
    RateLimiter limiter(make_config(1, 10s));
    auto        now = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.admit("c", now).allowed);
    EXPECT_EQ(limiter.admit("c", now + 2500ms).retry_after_seconds, 8);
    EXPECT_EQ(limiter.admit("c", now + 9999ms).retry_after_seconds, 1);
}

TEST(RateLimiterTest, WindowResetReplacesBucket) {
    RateLimiter limiter(make_config(2, 60s));
    auto        now = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.admit("c", now).allowed);
    EXPECT_TRUE(limiter.admit("c", now + 1s).allowed);
    EXPECT_FALSE(limiter.admit("c", now + 59s).allowed);

    // Window boundary: a fresh bucket, not an incremented one.
    EXPECT_TRUE(limiter.admit("c", now + 60s).allowed);
    EXPECT_TRUE(limiter.admit("c", now + 61s).allowed);
    EXPECT_FALSE(limiter.admit("c", now + 62s).allowed);
}

TEST(RateLimiterTest, ClientsAreIndependent) {
    RateLimiter limiter(make_config(1, 60s));
    auto        now = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.admit("a", now).allowed);
    EXPECT_FALSE(limiter.admit("a", now).allowed);
    EXPECT_TRUE(limiter.admit("b", now).allowed);
}

TEST(RateLimiterTest, PurgeExpired) {
    RateLimiter limiter(make_config(5, 10s));
    auto        now = RateLimiter::Clock::now();

    limiter.admit("a", now);
    limiter.admit("b", now + 5s);
    EXPECT_EQ(limiter.size(), 2u);

    EXPECT_EQ(limiter.purge_expired(now + 10s), 1u);
    EXPECT_EQ(limiter.size(), 1u);
    EXPECT_EQ(limiter.purge_expired(now + 15s), 1u);
    EXPECT_EQ(limiter.size(), 0u);
}

TEST(RateLimiterTest, BoundedSizeEvictsEarliestReset) {
    RateLimiter limiter(make_config(1, 60s, 2));
    auto        now = RateLimiter::Clock::now();

    limiter.admit("first", now);
    limiter.admit("second", now + 1s);
    limiter.admit("third", now + 2s);
    EXPECT_EQ(limiter.size(), 2u);

    // "first" was evicted, so it starts over with a fresh allowance.
    EXPECT_TRUE(limiter.admit("first", now + 3s).allowed);
    // That insert evicted "second"; "third" still has its bucket.
    EXPECT_FALSE(limiter.admit("third", now + 3s).allowed);
}

TEST(RateLimiterTest, FullMapPrefersExpiredBuckets) {
    RateLimiter limiter(make_config(1, 10s, 2));
    auto        now = RateLimiter::Clock::now();

    limiter.admit("old", now);
    limiter.admit("young", now + 9s);
    limiter.admit("new", now + 11s);

    EXPECT_EQ(limiter.size(), 2u);
    EXPECT_FALSE(limiter.admit("young", now + 12s).allowed);
}

TEST(RateLimiterTest, ConcurrentAdmissionsNeverExceedCapacity) {
    RateLimiter      limiter(make_config(100, 60s));
    std::atomic<int> granted{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                if (limiter.admit("shared").allowed)
                    ++granted;
            }
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(granted.load(), 100);
}
