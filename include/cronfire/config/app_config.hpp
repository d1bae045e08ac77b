#pragma once

#include <string>
#include <vector>

namespace cronfire {

struct OutputConfig {
  int count{9};
  bool utc{false};
};

struct ScheduleEntry {
  std::string name;
  std::string expression;
  // Optional exclusive end bound, "YYYY-MM-DD[THH:MM:SS]".
  std::string until;
};

struct AppConfig {
  std::string log_level{"warn"};
  OutputConfig output;
  std::vector<ScheduleEntry> schedules;
};

}  // namespace cronfire
