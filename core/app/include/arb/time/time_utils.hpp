#pragma once

#include <cstdint>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// UTC calendar helpers
// -----------------------------------------------------------------------------
//
// @brief  Free functions deriving calendar fields from epoch milliseconds.
//
// @details
// The daily risk counters roll over at the UTC date boundary, the
// time-of-day limit adjustment keys on the UTC hour, and the confidence
// features use UTC time of day and weekday. All of them take the value
// returned by ITimeProvider::now_ms() so simulated clocks drive them too.
//
// Implemented with integer civil-calendar arithmetic rather than
// std::gmtime, which is not thread-safe.
//
// Thread-safety: stateless, safe from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kMillisPerHour = 3600 * kMillisPerSecond;
constexpr std::int64_t kMillisPerDay = 24 * kMillisPerHour;

/// Whole days since 1970-01-01 (floor division, correct before 1970).
std::int64_t daysSinceEpoch(std::int64_t epoch_ms);

/// "YYYY-MM-DD" of the UTC calendar day containing epoch_ms.
std::string utcDate(std::int64_t epoch_ms);

/// UTC hour, 0..23.
int utcHour(std::int64_t epoch_ms);

/// UTC hour plus minutes as a fraction, 0.0 <= h < 24.0.
double utcFractionalHour(std::int64_t epoch_ms);

/// UTC weekday, 0 = Sunday .. 6 = Saturday.
int utcDayOfWeek(std::int64_t epoch_ms);

}  // namespace arb
