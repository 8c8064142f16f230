#include <aoilog/core/date_time.hpp>
#include <charconv>
#include <cstdio>
#include <ctime>

namespace aoilog::core {

namespace {

bool all_digits(std::string_view s) {
  for (const char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

// s is known to be all digits.
unsigned to_uint(std::string_view s) {
  unsigned v = 0;
  std::from_chars(s.data(), s.data() + s.size(), v);
  return v;
}

bool valid(const DateTime& dt) {
  const std::chrono::year_month_day ymd{std::chrono::year{dt.year},
                                        std::chrono::month{dt.month},
                                        std::chrono::day{dt.day}};
  return ymd.ok() && dt.hour < 24 && dt.minute < 60 && dt.second < 60;
}

}  // namespace

std::optional<DateTime> parse_compact_date_time(std::string_view date, std::string_view time) {
  if (date.size() != 8 || time.size() != 6 || !all_digits(date) || !all_digits(time)) {
    return std::nullopt;
  }
  DateTime dt;
  dt.year = static_cast<int>(to_uint(date.substr(0, 4)));
  dt.month = to_uint(date.substr(4, 2));
  dt.day = to_uint(date.substr(6, 2));
  dt.hour = to_uint(time.substr(0, 2));
  dt.minute = to_uint(time.substr(2, 2));
  dt.second = to_uint(time.substr(4, 2));
  if (!valid(dt)) return std::nullopt;
  return dt;
}

std::optional<DateTime> parse_date_time(std::string_view text) {
  // YYYY-MM-DD HH:MM:SS
  if (text.size() != 19 || text[4] != '-' || text[7] != '-' || text[10] != ' ' ||
      text[13] != ':' || text[16] != ':') {
    return std::nullopt;
  }
  const std::string date = std::string(text.substr(0, 4)) + std::string(text.substr(5, 2)) +
                           std::string(text.substr(8, 2));
  const std::string time = std::string(text.substr(11, 2)) + std::string(text.substr(14, 2)) +
                           std::string(text.substr(17, 2));
  return parse_compact_date_time(date, time);
}

std::string format_date_time(const DateTime& dt) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02u:%02u:%02u", dt.year, dt.month, dt.day,
                dt.hour, dt.minute, dt.second);
  return buf;
}

std::chrono::system_clock::time_point to_time_point(const DateTime& dt) {
  std::tm tm{};
  tm.tm_year = dt.year - 1900;
  tm.tm_mon = static_cast<int>(dt.month) - 1;
  tm.tm_mday = static_cast<int>(dt.day);
  tm.tm_hour = static_cast<int>(dt.hour);
  tm.tm_min = static_cast<int>(dt.minute);
  tm.tm_sec = static_cast<int>(dt.second);
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

DateTime from_time_point(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  DateTime dt;
  dt.year = tm.tm_year + 1900;
  dt.month = static_cast<unsigned>(tm.tm_mon + 1);
  dt.day = static_cast<unsigned>(tm.tm_mday);
  dt.hour = static_cast<unsigned>(tm.tm_hour);
  dt.minute = static_cast<unsigned>(tm.tm_min);
  dt.second = static_cast<unsigned>(tm.tm_sec);
  return dt;
}

}  // namespace aoilog::core
