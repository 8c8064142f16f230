#pragma once

#include <chrono>
#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace aoilog::core {

/// Naive local calendar timestamp as written by the inspection stations.
/// The default value (all zero) means "not set" and never passes the year >= 2000 check.
struct DateTime {
  int year{0};
  unsigned month{0};
  unsigned day{0};
  unsigned hour{0};
  unsigned minute{0};
  unsigned second{0};

  auto operator<=>(const DateTime&) const = default;
};

/// Parse the station format: date "YYYYMMDD" and time "HHMMSS".
/// Returns nullopt unless both have exact digit counts and form a valid calendar time.
[[nodiscard]] std::optional<DateTime> parse_compact_date_time(std::string_view date,
                                                              std::string_view time);

/// Parse "YYYY-MM-DD HH:MM:SS".
[[nodiscard]] std::optional<DateTime> parse_date_time(std::string_view text);

/// Format as "YYYY-MM-DD HH:MM:SS".
[[nodiscard]] std::string format_date_time(const DateTime& dt);

/// Interpret dt as local time.
[[nodiscard]] std::chrono::system_clock::time_point to_time_point(const DateTime& dt);

/// Local calendar time of tp.
[[nodiscard]] DateTime from_time_point(std::chrono::system_clock::time_point tp);

}  // namespace aoilog::core
