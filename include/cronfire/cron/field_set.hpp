#pragma once

#include "cronfire/core/error.hpp"

#include <bitset>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace cronfire {

// Inclusive value range of one schedule field, with optional names where
// names[i] denotes min_value + i.
struct FieldDomain {
  int min_value{0};
  int max_value{0};
  std::span<const std::string_view> names{};

  [[nodiscard]] constexpr auto width() const noexcept -> int {
    return max_value - min_value + 1;
  }
  [[nodiscard]] constexpr auto in_range(int v) const noexcept -> bool {
    return v >= min_value && v <= max_value;
  }
};

// Set of allowed values for one schedule field.
//
// min_set()/max_set() are the tightest bounds around the accumulated
// values; successor scans never look outside them.
class FieldSet {
public:
  static constexpr std::size_t kCapacity = 64;

  FieldSet() = default;

  [[nodiscard]] static auto parse(std::string_view token, FieldDomain domain)
      -> Result<FieldSet>;

  // Set holding exactly one value; used for the implicit seconds field.
  [[nodiscard]] static auto singleton(int value, FieldDomain domain)
      -> FieldSet;

  [[nodiscard]] auto first() const noexcept -> std::optional<int> {
    return next(min_set_);
  }

  [[nodiscard]] auto next(int start) const noexcept -> std::optional<int>;

  [[nodiscard]] auto contains(int value) const noexcept -> bool {
    return value >= min_value_ && value <= max_value_ &&
           bits_.test(static_cast<std::size_t>(value - min_value_));
  }

  [[nodiscard]] auto min_value() const noexcept -> int {
    return min_value_;
  }
  [[nodiscard]] auto max_value() const noexcept -> int {
    return max_value_;
  }
  [[nodiscard]] auto min_set() const noexcept -> int {
    return min_set_;
  }
  [[nodiscard]] auto max_set() const noexcept -> int {
    return max_set_;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return bits_.count();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return bits_.none();
  }

  [[nodiscard]] auto values() const -> std::vector<int>;

  // Compares membership and bounds; the names list is not part of the value.
  [[nodiscard]] friend auto operator==(const FieldSet& lhs,
                                       const FieldSet& rhs) noexcept -> bool {
    return lhs.bits_ == rhs.bits_ && lhs.min_value_ == rhs.min_value_ &&
           lhs.max_value_ == rhs.max_value_ && lhs.min_set_ == rhs.min_set_ &&
           lhs.max_set_ == rhs.max_set_;
  }

private:
  explicit FieldSet(FieldDomain domain);

  auto parse_subtoken(std::string_view token) -> Result<void>;
  auto parse_value(std::string_view token) const -> Result<int>;
  auto accumulate(int start, int end, int step) -> void;

  std::bitset<kCapacity> bits_;
  int min_value_{0};
  int max_value_{-1};
  // Empty set: min_set_ > max_set_.
  int min_set_{0};
  int max_set_{-1};
  std::span<const std::string_view> names_{};
};

}  // namespace cronfire
