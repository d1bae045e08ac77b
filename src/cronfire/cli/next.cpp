#include "cronfire/cli/commands.hpp"

#include <fmt/format.h>

namespace cronfire::cli {

auto cmd_next(const NextOptions& opts) -> int {
  auto schedule = Schedule::parse(opts.expression);
  if (!schedule) {
    fmt::print(stderr, "Error: '{}': {}\n", opts.expression,
               schedule.error().message());
    return 1;
  }

  return print_upcoming(*schedule, UpcomingRequest{
                                       .from = opts.from,
                                       .until = opts.until,
                                       .count = opts.count,
                                       .utc = opts.utc,
                                   });
}

}  // namespace cronfire::cli
