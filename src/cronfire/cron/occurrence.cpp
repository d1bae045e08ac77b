#include "cronfire/cron/occurrence.hpp"

#include <tuple>

namespace cronfire::detail {

auto resolve_candidate(const Schedule& schedule, const CalendarTime& from,
                       const CalendarTime& end)
    -> std::optional<CalendarTime> {
  const auto& seconds = schedule.seconds();
  const auto& minutes = schedule.minutes();
  const auto& hours = schedule.hours();
  const auto& days = schedule.days_of_month();
  const auto& months = schedule.months();

  auto first_second = seconds.first();
  auto first_minute = minutes.first();
  auto first_hour = hours.first();
  auto first_day = days.first();
  auto first_month = months.first();
  if (!first_second || !first_minute || !first_hour || !first_day ||
      !first_month || schedule.days_of_week().empty()) {
    return std::nullopt;
  }

  CalendarTime t = from;
  int carry = 0;

  auto reset_time = [&] {
    t.second = *first_second;
    t.minute = *first_minute;
    t.hour = *first_hour;
  };

  if (auto s = seconds.next(from.second)) {
    t.second = *s;
  } else {
    t.second = *first_second;
    carry = 1;
  }

  if (auto m = minutes.next(from.minute + carry)) {
    t.minute = *m;
    carry = 0;
    if (t.minute > from.minute)
      t.second = *first_second;
  } else {
    t.minute = *first_minute;
    t.second = *first_second;
    carry = 1;
  }

  if (auto h = hours.next(from.hour + carry)) {
    t.hour = *h;
    carry = 0;
    if (t.hour > from.hour) {
      t.minute = *first_minute;
      t.second = *first_second;
    }
  } else {
    reset_time();
    carry = 1;
  }

  // Day and month constrain each other (no February 30th), so they are
  // resolved together until the pair names a real date.
  auto day = days.next(from.day + carry);
  while (true) {
    if (!day) {
      reset_time();
      t.day = *first_day;
      ++t.month;
    } else {
      t.day = *day;
      if (t.day > from.day)
        reset_time();
    }

    if (auto m = months.next(t.month)) {
      t.month = *m;
      if (t.month > from.month) {
        reset_time();
        t.day = *first_day;
      }
    } else {
      reset_time();
      t.day = *first_day;
      t.month = *first_month;
      ++t.year;
    }

    bool date_changed =
        t.day != from.day || t.month != from.month || t.year != from.year;
    if (date_changed && t.day > days_in_month(t.year, t.month)) {
      if (std::tie(t.year, t.month, t.day) >=
          std::tie(end.year, end.month, end.day)) {
        return std::nullopt;
      }
      day.reset();
      continue;
    }
    break;
  }

  return t;
}

}  // namespace cronfire::detail
