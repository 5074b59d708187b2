#include "mcp-hub/server/RateLimiter.hpp"

#include <gtest/gtest.h>

using namespace mcphub::server;
using namespace std::chrono_literals;

class RateLimiterTest : public ::testing::Test {
protected:
  RateLimiter::Clock clock() {
    return [this] { return now_; };
  }

  std::chrono::steady_clock::time_point now_{std::chrono::steady_clock::now()};
};

TEST_F(RateLimiterTest, AllowsUpToLimit) {
  RateLimiter limiter(3, 60s, clock());
  EXPECT_TRUE(limiter.check("10.0.0.1").allowed);
  EXPECT_TRUE(limiter.check("10.0.0.1").allowed);
  RateDecision third = limiter.check("10.0.0.1");
  EXPECT_TRUE(third.allowed);
  EXPECT_EQ(third.remaining, 0);

  RateDecision fourth = limiter.check("10.0.0.1");
  EXPECT_FALSE(fourth.allowed);
  EXPECT_EQ(fourth.retry_after, 60s);
}

TEST_F(RateLimiterTest, ClientsCountedSeparately) {
  RateLimiter limiter(1, 60s, clock());
  EXPECT_TRUE(limiter.check("10.0.0.1").allowed);
  EXPECT_TRUE(limiter.check("10.0.0.2").allowed);
  EXPECT_FALSE(limiter.check("10.0.0.1").allowed);
}

TEST_F(RateLimiterTest, WindowResets) {
  RateLimiter limiter(1, 60s, clock());
  EXPECT_TRUE(limiter.check("c").allowed);
  now_ += 45s;
  RateDecision blocked = limiter.check("c");
  EXPECT_FALSE(blocked.allowed);
  EXPECT_EQ(blocked.retry_after, 15s);

  now_ += 15s;
  EXPECT_TRUE(limiter.check("c").allowed);
}

TEST_F(RateLimiterTest, RetryAfterRoundsUp) {
  RateLimiter limiter(1, 1000ms, clock());
  limiter.check("c");
  now_ += 100ms;
  EXPECT_EQ(limiter.check("c").retry_after, 1s);
}
