#pragma once

#include "cronfire/core/error.hpp"
#include "cronfire/cron/field_set.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cronfire {

enum class FieldKind : std::uint8_t {
  Second,
  Minute,
  Hour,
  DayOfMonth,
  Month,
  DayOfWeek,
};

inline constexpr std::size_t kFieldCount = 6;

inline constexpr std::array<std::string_view, 7> kWeekdayNames{
    "Sunday",   "Monday", "Tuesday", "Wednesday",
    "Thursday", "Friday", "Saturday"};

inline constexpr std::array<std::string_view, 12> kMonthNames{
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};

[[nodiscard]] constexpr auto field_domain(FieldKind kind) noexcept
    -> FieldDomain {
  switch (kind) {
    case FieldKind::Second: return {0, 59};
    case FieldKind::Minute: return {0, 59};
    case FieldKind::Hour: return {0, 23};
    case FieldKind::DayOfMonth: return {1, 31};
    case FieldKind::Month: return {1, 12, kMonthNames};
    case FieldKind::DayOfWeek: return {0, 6, kWeekdayNames};
  }
  return {};
}

[[nodiscard]] constexpr auto field_name(FieldKind kind) noexcept
    -> std::string_view {
  switch (kind) {
    case FieldKind::Second: return "second";
    case FieldKind::Minute: return "minute";
    case FieldKind::Hour: return "hour";
    case FieldKind::DayOfMonth: return "day-of-month";
    case FieldKind::Month: return "month";
    case FieldKind::DayOfWeek: return "day-of-week";
  }
  return "unknown";
}

// Parsed cron expression: one FieldSet per FieldKind.
//
// Accepts five fields (minute hour day-of-month month day-of-week) or six
// with a leading seconds field. Without one, seconds is fixed at 0.
class Schedule {
public:
  Schedule() = default;

  [[nodiscard]] static auto parse(std::string_view expr) -> Result<Schedule>;
  [[nodiscard]] static auto parse(const char* expr) -> Result<Schedule>;

  [[nodiscard]] auto field(FieldKind kind) const noexcept -> const FieldSet& {
    return fields_[static_cast<std::size_t>(kind)];
  }

  [[nodiscard]] auto seconds() const noexcept -> const FieldSet& {
    return field(FieldKind::Second);
  }
  [[nodiscard]] auto minutes() const noexcept -> const FieldSet& {
    return field(FieldKind::Minute);
  }
  [[nodiscard]] auto hours() const noexcept -> const FieldSet& {
    return field(FieldKind::Hour);
  }
  [[nodiscard]] auto days_of_month() const noexcept -> const FieldSet& {
    return field(FieldKind::DayOfMonth);
  }
  [[nodiscard]] auto months() const noexcept -> const FieldSet& {
    return field(FieldKind::Month);
  }
  [[nodiscard]] auto days_of_week() const noexcept -> const FieldSet& {
    return field(FieldKind::DayOfWeek);
  }

  [[nodiscard]] auto has_seconds() const noexcept -> bool {
    return has_seconds_;
  }

  [[nodiscard]] auto raw() const noexcept -> std::string_view {
    return raw_;
  }

private:
  using Fields = std::array<FieldSet, kFieldCount>;

  Schedule(std::string raw, Fields fields, bool has_seconds);

  std::string raw_;
  Fields fields_{};
  bool has_seconds_{false};
};

}  // namespace cronfire
