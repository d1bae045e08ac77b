#pragma once

#include "cronfire/cron/schedule.hpp"

#include <string>

namespace cronfire::cli {

struct NextOptions {
  std::string expression;
  std::string from;
  std::string until;
  int count{9};
  bool utc{false};
};

struct CheckOptions {
  std::string expression;
};

struct ScheduleFileOptions {
  std::string config_file;
  std::string log_level;
};

struct UpcomingRequest {
  std::string from;
  std::string until;
  int count{9};
  bool utc{false};
};

// Prints up to request.count occurrences, one per line, as
// "yyyy.MM.dd HH:mm:ss  Weekday". Returns a process exit status.
[[nodiscard]] auto print_upcoming(const Schedule& schedule,
                                  const UpcomingRequest& request) -> int;

[[nodiscard]] auto cmd_next(const NextOptions& opts) -> int;
[[nodiscard]] auto cmd_check(const CheckOptions& opts) -> int;
[[nodiscard]] auto cmd_schedule_file(const ScheduleFileOptions& opts) -> int;

}  // namespace cronfire::cli
