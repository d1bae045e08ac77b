#include "cronfire/cli/commands.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace cronfire::cli {

auto cmd_check(const CheckOptions& opts) -> int {
  auto schedule = Schedule::parse(opts.expression);
  if (!schedule) {
    fmt::print(stderr, "✗ {} - {}\n", opts.expression,
               schedule.error().message());
    return 1;
  }

  fmt::print("✓ {}\n", schedule->raw());
  for (auto kind : {FieldKind::Second, FieldKind::Minute, FieldKind::Hour,
                    FieldKind::DayOfMonth, FieldKind::Month,
                    FieldKind::DayOfWeek}) {
    const auto& field = schedule->field(kind);
    fmt::print("  {:<13} {}\n", field_name(kind),
               fmt::join(field.values(), ","));
  }
  if (!schedule->has_seconds()) {
    fmt::print("  (seconds field omitted, defaults to 0)\n");
  }
  return 0;
}

}  // namespace cronfire::cli
