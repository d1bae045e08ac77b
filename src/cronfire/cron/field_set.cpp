#include "cronfire/cron/field_set.hpp"

#include "cronfire/util/log.hpp"
#include "cronfire/util/strings.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ranges>
#include <utility>

namespace cronfire {
namespace {

auto is_digit(char c) noexcept -> bool {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

auto is_alpha(char c) noexcept -> bool {
  return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

FieldSet::FieldSet(FieldDomain domain)
    : min_value_(domain.min_value),
      max_value_(domain.max_value),
      min_set_(domain.max_value + 1),
      max_set_(domain.min_value - 1),
      names_(domain.names) {
}

auto FieldSet::parse(std::string_view token, FieldDomain domain)
    -> Result<FieldSet> {
  if (domain.width() <= 0 ||
      static_cast<std::size_t>(domain.width()) > kCapacity) {
    return fail(Error::InvalidArgument);
  }
  if (trim(token).empty()) {
    log::debug("Empty cron field token");
    return fail(Error::MalformedToken);
  }

  FieldSet set(domain);
  for (auto part : split_all(token, ',')) {
    if (auto r = set.parse_subtoken(part); !r) {
      log::debug("Can't parse cron token \"{}\" at \"{}\": {}", token, part,
                 r.error().message());
      return fail(r.error());
    }
  }
  return ok(std::move(set));
}

auto FieldSet::singleton(int value, FieldDomain domain) -> FieldSet {
  FieldSet set(domain);
  set.accumulate(value, value, 1);
  return set;
}

auto FieldSet::parse_subtoken(std::string_view token) -> Result<void> {
  if (token.empty())
    return fail(Error::MalformedToken);

  int step = 1;
  if (auto slash = token.find('/'); slash != std::string_view::npos) {
    if (slash == 0)
      return fail(Error::MalformedToken);
    auto step_opt = parse_int(token.substr(slash + 1));
    if (!step_opt || *step_opt < 0)
      return fail(Error::MalformedToken);
    step = *step_opt;
    token = token.substr(0, slash);
  }

  if (token == "*") {
    accumulate(min_value_, max_value_, step);
    return ok();
  }

  if (auto dash = token.find('-');
      dash != std::string_view::npos && dash > 0) {
    auto first = parse_value(token.substr(0, dash));
    if (!first)
      return fail(first.error());
    auto last = parse_value(token.substr(dash + 1));
    if (!last)
      return fail(last.error());
    accumulate(std::min(*first, *last), std::max(*first, *last), step);
    return ok();
  }

  auto value = parse_value(token);
  if (!value)
    return fail(value.error());

  if (step == 1) {
    accumulate(*value, *value, 1);
    return ok();
  }
  // "a/0" is the legacy spelling of "a through the end of the field".
  if (step == 0) {
    accumulate(*value, max_value_, 1);
    return ok();
  }
  return fail(Error::MalformedToken);
}

auto FieldSet::parse_value(std::string_view token) const -> Result<int> {
  if (token.empty())
    return fail(Error::MalformedToken);

  if (is_digit(token.front())) {
    int value = 0;
    auto [ptr, ec] =
        std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec == std::errc::result_out_of_range)
      return fail(Error::ValueOutOfRange);
    if (ec != std::errc{} || ptr != token.data() + token.size())
      return fail(Error::MalformedToken);
    if (value < min_value_ || value > max_value_)
      return fail(Error::ValueOutOfRange);
    return value;
  }

  if (!is_alpha(token.front()))
    return fail(Error::MalformedToken);

  auto it = std::ranges::find_if(names_, [token](std::string_view name) {
    return istarts_with(name, token);
  });
  if (it == names_.end())
    return fail(Error::UnknownName);
  return min_value_ + static_cast<int>(it - names_.begin());
}

// Requires min_value_ <= start <= end <= max_value_.
auto FieldSet::accumulate(int start, int end, int step) -> void {
  if (step < 1)
    step = 1;

  // Stop before `v + step` would pass `end`; the step may be near INT_MAX.
  int last = start;
  for (int v = start;; v += step) {
    bits_.set(static_cast<std::size_t>(v - min_value_));
    last = v;
    if (end - v < step)
      break;
  }
  min_set_ = std::min(min_set_, start);
  max_set_ = std::max(max_set_, last);
}

auto FieldSet::next(int start) const noexcept -> std::optional<int> {
  int from = std::max(start, min_set_);
  if (from > max_set_)
    return std::nullopt;

  auto range = std::views::iota(from, max_set_ + 1);
  auto it = std::ranges::find_if(range, [this](int v) { return contains(v); });
  if (it != range.end()) {
    return *it;
  }
  return std::nullopt;
}

auto FieldSet::values() const -> std::vector<int> {
  std::vector<int> result;
  result.reserve(size());
  for (auto v = first(); v; v = next(*v + 1)) {
    result.push_back(*v);
  }
  return result;
}

}  // namespace cronfire
