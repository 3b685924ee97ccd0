#include "utils.hpp"

#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <string>

namespace Utils {

namespace {

struct CivilDate {
  int64_t year;
  unsigned month;
  unsigned day;
};

// Proleptic Gregorian conversion, days counted from 1970-01-01.
CivilDate civil_from_days(int64_t z) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t y = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return {m <= 2 ? y + 1 : y, m, d};
}

int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

// Floors toward negative infinity so pre-epoch instants land on their own day.
CivilDate civil_from_ms(int64_t timestamp_ms) {
  int64_t days = timestamp_ms / MS_PER_DAY;
  if (timestamp_ms % MS_PER_DAY < 0)
    --days;
  return civil_from_days(days);
}

} // namespace

int month_of_year_utc(int64_t timestamp_ms) {
  return static_cast<int>(civil_from_ms(timestamp_ms).month);
}

std::string format_date_utc(int64_t timestamp_ms) {
  const CivilDate date = civil_from_ms(timestamp_ms);
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u",
                static_cast<long long>(date.year), date.month, date.day);
  return buffer;
}

int64_t utc_date_to_ms(int year, unsigned month, unsigned day) {
  return days_from_civil(year, month, day) * MS_PER_DAY;
}

std::string format_fixed(double value, int precision) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << value;
  return oss.str();
}

} // namespace Utils
