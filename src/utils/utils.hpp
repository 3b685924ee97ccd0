#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace Utils {

constexpr int64_t MS_PER_DAY = 24LL * 60 * 60 * 1000;

// Calendar month (1-12) of a UTC millisecond timestamp. Negative timestamps
// are before 1970.
int month_of_year_utc(int64_t timestamp_ms);

// "YYYY-MM-DD" of a UTC millisecond timestamp.
std::string format_date_utc(int64_t timestamp_ms);

// Milliseconds since epoch for 00:00:00 UTC on the given civil date.
int64_t utc_date_to_ms(int year, unsigned month, unsigned day);

// Fixed-point rendering, e.g. format_fixed(3.14159, 2) -> "3.14".
std::string format_fixed(double value, int precision);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty())
    return std::nullopt;

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}

inline std::string to_lower_copy(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // namespace Utils

#endif // UTILS_HPP
