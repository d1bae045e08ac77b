#pragma once

#include "cronfire/core/error.hpp"
#include "cronfire/cron/clock.hpp"
#include "cronfire/cron/schedule.hpp"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string_view>
#include <type_traits>
#include <vector>

namespace cronfire {

namespace detail {

// Resolves the earliest date and time of day at or after `from` that
// satisfies every field except day-of-week. Returns nullopt when no valid
// date exists before `end`.
[[nodiscard]] auto resolve_candidate(const Schedule& schedule,
                                     const CalendarTime& from,
                                     const CalendarTime& end)
    -> std::optional<CalendarTime>;

}  // namespace detail

// Earliest instant strictly after `start` and before `end` that matches
// every field of `schedule`. Returns `end` unchanged when there is none;
// callers detect "no occurrence" by comparing the result with `end`.
template <CalendarClock Clock>
[[nodiscard]] auto next_occurrence(const Schedule& schedule,
                                   Instant<Clock> start,
                                   Instant<Clock> end = max_instant<Clock>())
    -> Instant<Clock> {
  auto limit = std::min(end, max_instant<Clock>());
  if (start >= limit)
    return end;

  // Inclusive lower bound of the search.
  auto from = std::max(start + std::chrono::seconds{1}, min_instant<Clock>());
  auto end_fields = to_calendar(limit);

  while (true) {
    auto fields =
        detail::resolve_candidate(schedule, to_calendar(from), end_fields);
    if (!fields)
      return end;

    auto candidate = from_calendar<Clock>(*fields);
    if (candidate >= limit)
      return end;

    if (schedule.days_of_week().contains(weekday_of(candidate)))
      return candidate;

    // Wrong weekday: nothing later on this date can match either.
    from = std::chrono::floor<std::chrono::days>(candidate) +
           std::chrono::days{1};
  }
}

// Up to `max_count` consecutive occurrences in [start, end).
template <CalendarClock Clock>
[[nodiscard]] auto occurrences_between(const Schedule& schedule,
                                       Instant<Clock> start,
                                       Instant<Clock> end,
                                       std::size_t max_count = 1000)
    -> std::vector<Instant<Clock>> {
  std::vector<Instant<Clock>> result;
  result.reserve(std::min(max_count, std::size_t{64}));

  auto current = start - std::chrono::seconds{1};
  while (result.size() < max_count) {
    current = next_occurrence(schedule, current, end);
    if (current >= end) {
      break;
    }
    result.push_back(current);
  }

  return result;
}

template <typename T>
concept ExpressionText = std::convertible_to<const T&, std::string_view>;

namespace detail {

template <ExpressionText T>
[[nodiscard]] auto parse_expression(const T& expr) -> Result<Schedule> {
  // Pointers go through the overload that rejects null.
  if constexpr (std::is_convertible_v<const T&, const char*>) {
    return Schedule::parse(static_cast<const char*>(expr));
  } else {
    return Schedule::parse(std::string_view{expr});
  }
}

}  // namespace detail

// Parses `expr` and returns its next occurrence after `start`. Parse
// failures are returned as errors; "no occurrence before `end`" is the
// value `end`.
template <ExpressionText T, CalendarClock Clock>
[[nodiscard]] auto next_fire(const T& expr, Instant<Clock> start,
                             Instant<Clock> end = max_instant<Clock>())
    -> Result<Instant<Clock>> {
  auto schedule = detail::parse_expression(expr);
  if (!schedule)
    return fail(schedule.error());
  return next_occurrence(*schedule, start, end);
}

// Start taken from an injected clock, e.g. SystemNow or LocalNow.
template <ExpressionText T, typename Now>
  requires std::invocable<const Now&>
[[nodiscard]] auto next_fire(const T& expr, const Now& now) {
  return next_fire(expr, now());
}

// Start is the current local wall-clock time.
template <ExpressionText T>
[[nodiscard]] auto next_fire(const T& expr) -> Result<LocalInstant> {
  return next_fire(expr, LocalNow{});
}

}  // namespace cronfire
