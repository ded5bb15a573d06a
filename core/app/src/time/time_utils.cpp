#include "arb/time/time_utils.hpp"

#include <cstdio>

namespace arb {

namespace {

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

std::int64_t msOfDay(std::int64_t epoch_ms) {
  return epoch_ms - daysSinceEpoch(epoch_ms) * kMillisPerDay;
}

}  // namespace

std::int64_t daysSinceEpoch(std::int64_t epoch_ms) {
  return floorDiv(epoch_ms, kMillisPerDay);
}

std::string utcDate(std::int64_t epoch_ms) {
  // Days -> civil date (proleptic Gregorian), era-based algorithm.
  std::int64_t z = daysSinceEpoch(epoch_ms) + 719468;
  const std::int64_t era = floorDiv(z, 146097);
  const std::int64_t doe = z - era * 146097;
  const std::int64_t yoe =
      (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const std::int64_t mp = (5 * doy + 2) / 153;
  const std::int64_t day = doy - (153 * mp + 2) / 5 + 1;
  const std::int64_t month = mp < 10 ? mp + 3 : mp - 9;
  const std::int64_t year = yoe + era * 400 + (month <= 2 ? 1 : 0);

  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04lld-%02lld-%02lld",
                static_cast<long long>(year), static_cast<long long>(month),
                static_cast<long long>(day));
  return buffer;
}

int utcHour(std::int64_t epoch_ms) {
  return static_cast<int>(msOfDay(epoch_ms) / kMillisPerHour);
}

double utcFractionalHour(std::int64_t epoch_ms) {
  return static_cast<double>(msOfDay(epoch_ms)) /
         static_cast<double>(kMillisPerHour);
}

int utcDayOfWeek(std::int64_t epoch_ms) {
  // 1970-01-01 was a Thursday (4).
  const std::int64_t days = daysSinceEpoch(epoch_ms);
  std::int64_t weekday = (days + 4) % 7;
  if (weekday < 0) {
    weekday += 7;
  }
  return static_cast<int>(weekday);
}

}  // namespace arb
