#include "cronfire/cli/commands.hpp"
#include "cronfire/config/config.hpp"
#include "cronfire/util/log.hpp"

#include <fmt/format.h>

namespace cronfire::cli {

auto cmd_schedule_file(const ScheduleFileOptions& opts) -> int {
  auto result = ConfigLoader::load_from_file(opts.config_file);
  if (!result) {
    fmt::print(stderr, "Error: {}\n", result.error().message());
    return 1;
  }
  const auto& config = *result;

  log::set_level(opts.log_level.empty() ? config.log_level : opts.log_level);

  if (config.schedules.empty()) {
    log::warn("No schedules defined in {}", opts.config_file);
    return 0;
  }

  int failures = 0;
  for (const auto& entry : config.schedules) {
    fmt::print("{}: {}\n", entry.name, entry.expression);

    auto schedule = Schedule::parse(entry.expression);
    if (!schedule) {
      fmt::print("  ✗ {}\n", schedule.error().message());
      ++failures;
      continue;
    }

    if (print_upcoming(*schedule, UpcomingRequest{
                                      .until = entry.until,
                                      .count = config.output.count,
                                      .utc = config.output.utc,
                                  }) != 0) {
      ++failures;
    }
  }

  log::info("Processed {} schedules, {} failed", config.schedules.size(),
            failures);
  return failures > 0 ? 1 : 0;
}

}  // namespace cronfire::cli
