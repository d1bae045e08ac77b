#include "cronfire/cron/clock.hpp"

#include "cronfire/cron/schedule.hpp"
#include "cronfire/util/strings.hpp"

#include <fmt/format.h>

#include <ctime>

namespace cronfire {

auto SystemNow::operator()() const -> SysInstant {
  return std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
}

auto LocalNow::operator()() const -> LocalInstant {
  auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&t, &tm);
  return from_calendar<std::chrono::local_t>({
      tm.tm_year + 1900,
      tm.tm_mon + 1,
      tm.tm_mday,
      tm.tm_hour,
      tm.tm_min,
      // Leap second reported by localtime; fold it into the minute.
      tm.tm_sec > 59 ? 59 : tm.tm_sec,
  });
}

auto format_calendar(const CalendarTime& t) -> std::string {
  return fmt::format("{:04d}.{:02d}.{:02d} {:02d}:{:02d}:{:02d}", t.year,
                     t.month, t.day, t.hour, t.minute, t.second);
}

auto weekday_name(int weekday) noexcept -> std::string_view {
  if (weekday < 0 || weekday >= static_cast<int>(kWeekdayNames.size()))
    return "Unknown";
  return kWeekdayNames[static_cast<std::size_t>(weekday)];
}

auto parse_calendar(std::string_view text) -> Result<CalendarTime> {
  text = trim(text);
  // YYYY-MM-DD, optionally followed by 'T' or ' ' and HH:MM:SS
  if (text.size() != 10 && text.size() != 19)
    return fail(Error::InvalidArgument);
  if (text[4] != '-' || text[7] != '-')
    return fail(Error::InvalidArgument);

  auto y = parse_int(text.substr(0, 4));
  auto mo = parse_int(text.substr(5, 2));
  auto d = parse_int(text.substr(8, 2));
  if (!y || !mo || !d)
    return fail(Error::InvalidArgument);

  CalendarTime t{*y, *mo, *d, 0, 0, 0};
  if (text.size() == 19) {
    if ((text[10] != 'T' && text[10] != ' ') || text[13] != ':' ||
        text[16] != ':') {
      return fail(Error::InvalidArgument);
    }
    auto h = parse_int(text.substr(11, 2));
    auto mi = parse_int(text.substr(14, 2));
    auto s = parse_int(text.substr(17, 2));
    if (!h || !mi || !s)
      return fail(Error::InvalidArgument);
    t.hour = *h;
    t.minute = *mi;
    t.second = *s;
  }

  if (t.year < 1 || t.month < 1 || t.month > 12 || t.day < 1 ||
      t.day > days_in_month(t.year, t.month) || t.hour < 0 || t.hour > 23 ||
      t.minute < 0 || t.minute > 59 || t.second < 0 || t.second > 59) {
    return fail(Error::InvalidArgument);
  }
  return t;
}

}  // namespace cronfire
