#include "cronfire/cli/commands.hpp"
#include "cronfire/cron/occurrence.hpp"
#include "cronfire/util/log.hpp"

#include <fmt/format.h>

namespace cronfire::cli {
namespace {

template <CalendarClock Clock, typename Now>
auto print_upcoming_in(const Schedule& schedule, const UpcomingRequest& request,
                       const Now& now) -> int {
  Instant<Clock> start;
  if (request.from.empty()) {
    start = now();
  } else {
    auto parsed = parse_instant<Clock>(request.from);
    if (!parsed) {
      fmt::print(stderr, "Error: invalid start time '{}': {}\n", request.from,
                 parsed.error().message());
      return 1;
    }
    start = *parsed;
  }

  Instant<Clock> end = max_instant<Clock>();
  if (!request.until.empty()) {
    auto parsed = parse_instant<Clock>(request.until);
    if (!parsed) {
      fmt::print(stderr, "Error: invalid end time '{}': {}\n", request.until,
                 parsed.error().message());
      return 1;
    }
    end = *parsed;
  }

  log::debug("Searching \"{}\" from {} until {}", schedule.raw(),
             format_instant(start), format_instant(end));

  auto current = start;
  for (int i = 0; i < request.count; ++i) {
    current = next_occurrence(schedule, current, end);
    if (current == end) {
      fmt::print("No further occurrences before {}\n", format_instant(end));
      break;
    }
    fmt::print("{}  {}\n", format_instant(current), weekday_name(current));
  }
  return 0;
}

}  // namespace

auto print_upcoming(const Schedule& schedule, const UpcomingRequest& request)
    -> int {
  if (request.utc) {
    return print_upcoming_in<std::chrono::system_clock>(schedule, request,
                                                        SystemNow{});
  }
  return print_upcoming_in<std::chrono::local_t>(schedule, request,
                                                 LocalNow{});
}

}  // namespace cronfire::cli
