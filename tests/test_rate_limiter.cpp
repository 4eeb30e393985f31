#include <gtest/gtest.h>
#include <tbproxy/rate_limiter.hpp>

#include <atomic>
#include <boost/thread.hpp>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace std::chrono;
using tbproxy::RateDecision;
using tbproxy::RateLimiter;
using tbproxy::RateLimiterConfig;

namespace {

// Manually advanced monotonic clock.
struct FakeClock {
  steady_clock::time_point t = steady_clock::time_point{} + hours(24);

  tbproxy::SteadyClock source() {
    return [this] { return t; };
  }
};

RateLimiterConfig limits(int max_requests, int window_seconds,
                         std::size_t max_identities = 10000) {
  RateLimiterConfig c;
  c.max_requests = max_requests;
  c.window_seconds = window_seconds;
  c.max_identities = max_identities;
  return c;
}

} // namespace

TEST(RateLimiter, TwoPerMinuteTimeline) {
  FakeClock clock;
  const auto t0 = clock.t;
  RateLimiter rl(limits(2, 60), clock.source());

  RateDecision d = rl.admit("X");
  EXPECT_TRUE(d.allowed);
  EXPECT_EQ(d.remaining, 1);

  d = rl.admit("X");
  EXPECT_TRUE(d.allowed);
  EXPECT_EQ(d.remaining, 0);

  clock.t = t0 + seconds(10);
  d = rl.admit("X");
  EXPECT_FALSE(d.allowed);
  EXPECT_EQ(d.remaining, 0);
  EXPECT_EQ(d.reset_at, t0 + seconds(60));
  EXPECT_EQ(d.retry_after(clock.t), 50);

  clock.t = t0 + seconds(61);
  d = rl.admit("X");
  EXPECT_TRUE(d.allowed);
  EXPECT_EQ(d.remaining, 1);
}

TEST(RateLimiter, InstantExactlyOneWindowOldStillCounts) {
  FakeClock clock;
  const auto t0 = clock.t;
  RateLimiter rl(limits(1, 60), clock.source());

  EXPECT_TRUE(rl.admit("X").allowed);
  EXPECT_FALSE(rl.admit("X", t0 + seconds(60)).allowed);
  EXPECT_TRUE(rl.admit("X", t0 + seconds(60) + milliseconds(1)).allowed);
}

TEST(RateLimiter, NoDoubleBurstAcrossWindowBoundary) {
  FakeClock clock;
  const auto t0 = clock.t;
  const int max = 5;
  RateLimiter rl(limits(max, 60), clock.source());

  // burst at the end of one minute ...
  for (int i = 0; i < max; ++i)
    EXPECT_TRUE(rl.admit("X", t0 + seconds(59)).allowed);

  // ... and the start of the next one gets nothing more
  int admitted = 0;
  for (int i = 0; i < max; ++i)
    admitted += rl.admit("X", t0 + seconds(61)).allowed ? 1 : 0;
  EXPECT_EQ(admitted, 0);

  // a full window after the burst the quota is back
  for (int i = 0; i < max; ++i)
    admitted += rl.admit("X", t0 + seconds(120)).allowed ? 1 : 0;
  EXPECT_EQ(admitted, max);
}

TEST(RateLimiter, RejectionsDoNotConsumeQuota) {
  FakeClock clock;
  const auto t0 = clock.t;
  RateLimiter rl(limits(2, 60), clock.source());

  rl.admit("X", t0);
  rl.admit("X", t0 + seconds(1));

  // hammering while limited must not push the reset point out
  for (int s = 2; s < 60; ++s) {
    const RateDecision d = rl.admit("X", t0 + seconds(s));
    ASSERT_FALSE(d.allowed);
    EXPECT_EQ(d.reset_at, t0 + seconds(60));
  }

  // first admission left at t0+60; the second one still counts
  EXPECT_TRUE(rl.admit("X", t0 + seconds(61)).allowed);
  EXPECT_FALSE(rl.admit("X", t0 + seconds(61)).allowed);
  EXPECT_TRUE(rl.admit("X", t0 + seconds(122)).allowed);
}

TEST(RateLimiter, IdentitiesAreIndependent) {
  FakeClock clock;
  RateLimiter rl(limits(1, 60), clock.source());

  EXPECT_TRUE(rl.admit("10.0.0.1").allowed);
  EXPECT_FALSE(rl.admit("10.0.0.1").allowed);
  EXPECT_TRUE(rl.admit("10.0.0.2").allowed);
}

TEST(RateLimiter, ResetAtTracksOldestAdmission) {
  FakeClock clock;
  const auto t0 = clock.t;
  RateLimiter rl(limits(3, 60), clock.source());

  EXPECT_EQ(rl.admit("X", t0).reset_at, t0 + seconds(60));
  EXPECT_EQ(rl.admit("X", t0 + seconds(20)).reset_at, t0 + seconds(60));
}

TEST(RateLimiter, OutOfOrderInstantsKeepWindowSorted) {
  FakeClock clock;
  const auto t0 = clock.t;
  RateLimiter rl(limits(2, 60), clock.source());

  EXPECT_TRUE(rl.admit("X", t0 + seconds(30)).allowed);
  EXPECT_TRUE(rl.admit("X", t0 + seconds(29)).allowed);

  const RateDecision d = rl.admit("X", t0 + seconds(31));
  EXPECT_FALSE(d.allowed);
  EXPECT_EQ(d.reset_at, t0 + seconds(89));
}

TEST(RateLimiter, RetryAfterIsAtLeastOneSecond) {
  RateDecision d;
  d.allowed = false;
  const auto now = steady_clock::time_point{} + hours(1);
  d.reset_at = now + milliseconds(200);
  EXPECT_EQ(d.retry_after(now), 1);
  d.reset_at = now;
  EXPECT_EQ(d.retry_after(now), 1);
  d.reset_at = now + milliseconds(49'500);
  EXPECT_EQ(d.retry_after(now), 50);
}

TEST(RateLimiter, ConcurrentCallersNeverExceedLimit) {
  const int max = 50;
  RateLimiter rl(limits(max, 60));

  std::atomic<int> admitted{0};
  std::vector<std::unique_ptr<boost::thread>> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back(std::make_unique<boost::thread>([&] {
      for (int i = 0; i < 40; ++i) {
        if (rl.admit("shared").allowed)
          admitted.fetch_add(1);
      }
    }));
  }
  for (auto &t : threads)
    t->join();

  EXPECT_EQ(admitted.load(), max);
}

TEST(RateLimiter, IdleIdentitiesAreEvictedLeastRecentFirst) {
  FakeClock clock;
  RateLimiter rl(limits(1, 60, 1), clock.source());

  EXPECT_TRUE(rl.admit("a").allowed);
  EXPECT_TRUE(rl.admit("b").allowed);
  EXPECT_EQ(rl.tracked_count(), 1u);
  EXPECT_FALSE(rl.is_tracked("a"));
  EXPECT_TRUE(rl.is_tracked("b"));
  EXPECT_EQ(rl.eviction_count(), 1u);

  // an evicted identity starts over
  EXPECT_TRUE(rl.admit("a").allowed);
}

TEST(RateLimiter, TableStaysBounded) {
  FakeClock clock;
  RateLimiter rl(limits(10, 60, 32), clock.source());

  for (int i = 0; i < 1000; ++i)
    rl.admit("client-" + std::to_string(i));

  EXPECT_LE(rl.tracked_count(), 32u);
  EXPECT_GE(rl.eviction_count(), 1000u - 32u);
  EXPECT_TRUE(rl.is_tracked("client-999"));
}

TEST(RateLimiter, RejectsNonPositiveConfiguration) {
  EXPECT_THROW(RateLimiter{limits(0, 60)}, std::invalid_argument);
  EXPECT_THROW(RateLimiter{limits(10, 0)}, std::invalid_argument);
  EXPECT_THROW(RateLimiter{limits(10, 60, 0)}, std::invalid_argument);
}
