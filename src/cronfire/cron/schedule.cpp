#include "cronfire/cron/schedule.hpp"

#include "cronfire/util/log.hpp"
#include "cronfire/util/strings.hpp"

#include <utility>

namespace cronfire {
namespace {

// Field kinds in the order tokens are consumed, last token first.
constexpr std::array<FieldKind, kFieldCount> kRightToLeft{
    FieldKind::DayOfWeek, FieldKind::Month,  FieldKind::DayOfMonth,
    FieldKind::Hour,      FieldKind::Minute, FieldKind::Second,
};

}  // namespace

Schedule::Schedule(std::string raw, Fields fields, bool has_seconds)
    : raw_(std::move(raw)), fields_(std::move(fields)),
      has_seconds_(has_seconds) {
}

auto Schedule::parse(const char* expr) -> Result<Schedule> {
  if (expr == nullptr) {
    log::debug("Null cron expression");
    return fail(Error::NullInput);
  }
  return parse(std::string_view{expr});
}

auto Schedule::parse(std::string_view expr) -> Result<Schedule> {
  auto tokens = split_whitespace(expr);
  if (tokens.size() < 5 || tokens.size() > kFieldCount) {
    log::debug("Cron expression \"{}\" has {} fields, expected 5 or 6", expr,
               tokens.size());
    return fail(Error::TokenCount);
  }

  Fields fields{};
  auto token = tokens.rbegin();
  for (auto kind : kRightToLeft) {
    if (token == tokens.rend()) {
      fields[static_cast<std::size_t>(kind)] =
          FieldSet::singleton(0, field_domain(kind));
      continue;
    }
    auto set = FieldSet::parse(*token++, field_domain(kind));
    if (!set) {
      log::debug("Invalid {} field in \"{}\"", field_name(kind), expr);
      return fail(set.error());
    }
    fields[static_cast<std::size_t>(kind)] = std::move(*set);
  }

  return ok(Schedule(std::string(trim(expr)), std::move(fields),
                     tokens.size() == kFieldCount));
}

}  // namespace cronfire
