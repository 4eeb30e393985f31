#include <gtest/gtest.h>
#include <tbproxy/time_utils.hpp>

using namespace std::chrono;
using tbproxy::ceil_seconds;
using tbproxy::unix_seconds_at;

TEST(TimeConv, WholeSecondsPassThrough) {
  EXPECT_EQ(ceil_seconds(seconds(60)), 60);
}

TEST(TimeConv, FractionRoundsUp) {
  EXPECT_EQ(ceil_seconds(milliseconds(1)), 1);
  EXPECT_EQ(ceil_seconds(milliseconds(59'001)), 60);
}

TEST(TimeConv, NonPositiveIsZero) {
  EXPECT_EQ(ceil_seconds(steady_clock::duration::zero()), 0);
  EXPECT_EQ(ceil_seconds(-seconds(5)), 0);
}

TEST(TimeConv, SteadyInstantProjectsOntoWallClock) {
  const auto steady = steady_clock::time_point{} + hours(1);
  const system_clock::time_point wall{seconds(1'730'000'000)};
  EXPECT_EQ(unix_seconds_at(steady + seconds(42), steady, wall),
            1'730'000'042);
  EXPECT_EQ(unix_seconds_at(steady - seconds(10), steady, wall),
            1'729'999'990);
}

TEST(TimeConv, UnixMillisIsMilliseconds) {
  const auto ms = tbproxy::unix_millis_now();
  // later than 2020-01-01 and not a microsecond value
  EXPECT_GT(ms, 1'577'836'800'000LL);
  EXPECT_LT(ms, 10'000'000'000'000LL);
}
