#pragma once

#include "cronfire/core/error.hpp"

#include <array>
#include <chrono>
#include <concepts>
#include <string>
#include <string_view>

namespace cronfire {

// Clocks whose time points can be read as calendar fields without any zone
// conversion: system_clock (UTC) and the local_t pseudo-clock.
template <typename Clock>
concept CalendarClock = std::same_as<Clock, std::chrono::system_clock> ||
                        std::same_as<Clock, std::chrono::local_t>;

template <CalendarClock Clock>
using Instant = std::chrono::time_point<Clock, std::chrono::seconds>;

using SysInstant = Instant<std::chrono::system_clock>;
using LocalInstant = Instant<std::chrono::local_t>;

// Broken-down calendar time; month is 1-based, like the schedule fields.
struct CalendarTime {
  int year{1};
  int month{1};
  int day{1};
  int hour{0};
  int minute{0};
  int second{0};

  [[nodiscard]] friend auto operator==(const CalendarTime&,
                                       const CalendarTime&) -> bool = default;
};

[[nodiscard]] constexpr auto is_leap_year(int year) noexcept -> bool {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

[[nodiscard]] constexpr auto days_in_month(int year, int month) noexcept
    -> int {
  constexpr std::array<int, 12> days{31, 28, 31, 30, 31, 30,
                                     31, 31, 30, 31, 30, 31};
  int d = days[static_cast<std::size_t>(month - 1)];
  if (month == 2 && is_leap_year(year)) {
    d = 29;
  }
  return d;
}

template <CalendarClock Clock>
[[nodiscard]] constexpr auto to_calendar(Instant<Clock> tp) noexcept
    -> CalendarTime {
  using namespace std::chrono;
  auto midnight = floor<days>(tp);
  year_month_day ymd{midnight};
  hh_mm_ss hms{tp - midnight};
  return {
      static_cast<int>(ymd.year()),
      static_cast<int>(static_cast<unsigned>(ymd.month())),
      static_cast<int>(static_cast<unsigned>(ymd.day())),
      static_cast<int>(hms.hours().count()),
      static_cast<int>(hms.minutes().count()),
      static_cast<int>(hms.seconds().count()),
  };
}

// The fields must name a valid date and time of day.
template <CalendarClock Clock>
[[nodiscard]] constexpr auto from_calendar(const CalendarTime& t) noexcept
    -> Instant<Clock> {
  using namespace std::chrono;
  year_month_day ymd{year{t.year}, month{static_cast<unsigned>(t.month)},
                     day{static_cast<unsigned>(t.day)}};
  return time_point<Clock, days>(ymd) + hours{t.hour} + minutes{t.minute} +
         seconds{t.second};
}

// Day of week with 0 = Sunday.
template <CalendarClock Clock>
[[nodiscard]] constexpr auto weekday_of(Instant<Clock> tp) noexcept -> int {
  using namespace std::chrono;
  return static_cast<int>(weekday{floor<days>(tp)}.c_encoding());
}

// Search ceiling and default end bound: 9999-12-31 23:59:59.
template <CalendarClock Clock>
[[nodiscard]] constexpr auto max_instant() noexcept -> Instant<Clock> {
  return from_calendar<Clock>({9999, 12, 31, 23, 59, 59});
}

// Earliest instant the calendar arithmetic accepts: 0001-01-01 00:00:00.
template <CalendarClock Clock>
[[nodiscard]] constexpr auto min_instant() noexcept -> Instant<Clock> {
  return from_calendar<Clock>({1, 1, 1, 0, 0, 0});
}

// "Now" providers. The search never reads a clock itself; callers pass one
// of these (or any callable returning an Instant) where a default start is
// wanted.
struct SystemNow {
  [[nodiscard]] auto operator()() const -> SysInstant;
};

// Wall-clock time of the process's local zone, tagged as local_t.
struct LocalNow {
  [[nodiscard]] auto operator()() const -> LocalInstant;
};

// "yyyy.MM.dd HH:mm:ss"
[[nodiscard]] auto format_calendar(const CalendarTime& t) -> std::string;

template <CalendarClock Clock>
[[nodiscard]] auto format_instant(Instant<Clock> tp) -> std::string {
  return format_calendar(to_calendar(tp));
}

[[nodiscard]] auto weekday_name(int weekday) noexcept -> std::string_view;

template <CalendarClock Clock>
[[nodiscard]] auto weekday_name(Instant<Clock> tp) noexcept
    -> std::string_view {
  return weekday_name(weekday_of(tp));
}

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" or "YYYY-MM-DD HH:MM:SS".
[[nodiscard]] auto parse_calendar(std::string_view text)
    -> Result<CalendarTime>;

template <CalendarClock Clock>
[[nodiscard]] auto parse_instant(std::string_view text)
    -> Result<Instant<Clock>> {
  auto t = parse_calendar(text);
  if (!t)
    return fail(t.error());
  return from_calendar<Clock>(*t);
}

}  // namespace cronfire
