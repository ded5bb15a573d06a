// =============================================================================
// time_utils_test.cpp
// =============================================================================
// Unit tests for the UTC calendar helpers and the time providers.
// =============================================================================

#include "arb/time/live_time_provider.hpp"
#include "arb/time/simulation_time_provider.hpp"
#include "arb/time/time_utils.hpp"

#include <gtest/gtest.h>

namespace {

// 2024-01-01 12:00:00 UTC, a Monday.
constexpr std::int64_t kNoon = 1704110400000;

}  // namespace

TEST(TimeUtilsTest, UtcDate) {
  EXPECT_EQ(arb::utcDate(0), "1970-01-01");
  EXPECT_EQ(arb::utcDate(kNoon), "2024-01-01");
  EXPECT_EQ(arb::utcDate(kNoon - 12 * arb::kMillisPerHour - 1), "2023-12-31");
  // 2024-02-29 00:00:00 UTC
  EXPECT_EQ(arb::utcDate(1709164800000), "2024-02-29");
  EXPECT_EQ(arb::utcDate(1709164800000 + arb::kMillisPerDay), "2024-03-01");
}

// -----------------------------------------------------------------------------
// Why: Floor division; truncation would put the last millisecond of
//      1969 on 1970-01-01.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, BeforeEpoch) {
  EXPECT_EQ(arb::daysSinceEpoch(-1), -1);
  EXPECT_EQ(arb::utcDate(-1), "1969-12-31");
  EXPECT_EQ(arb::utcHour(-1), 23);
  EXPECT_EQ(arb::utcDayOfWeek(-1), 3);
}

TEST(TimeUtilsTest, HourAndWeekday) {
  EXPECT_EQ(arb::utcHour(kNoon), 12);
  EXPECT_EQ(arb::utcHour(kNoon + 11 * arb::kMillisPerHour + 59 * 60000), 23);
  EXPECT_DOUBLE_EQ(arb::utcFractionalHour(kNoon + 30 * 60000), 12.5);
  EXPECT_EQ(arb::utcDayOfWeek(0), 4);  // Thursday
  EXPECT_EQ(arb::utcDayOfWeek(kNoon), 1);
  EXPECT_EQ(arb::utcDayOfWeek(kNoon + 6 * arb::kMillisPerDay), 0);
}

TEST(TimeProviderTest, SimulationClockMovesOnlyWhenTold) {
  arb::SimulationTimeProvider clock(kNoon);
  EXPECT_EQ(clock.now_ms(), kNoon);
  EXPECT_EQ(clock.now_ms(), kNoon);

  clock.advance_by(1500);
  EXPECT_EQ(clock.now_ms(), kNoon + 1500);

  clock.advance_time(0);
  EXPECT_EQ(clock.now_ms(), 0);
}

TEST(TimeProviderTest, LiveClockIsMonotonicEnough) {
  arb::LiveTimeProvider clock;
  const auto a = clock.now_ms();
  const auto b = clock.now_ms();
  EXPECT_GT(a, kNoon);
  EXPECT_GE(b, a);
}
