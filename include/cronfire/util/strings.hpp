#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <ranges>
#include <string_view>
#include <system_error>
#include <vector>

namespace cronfire {

inline constexpr auto is_space = [](unsigned char c) {
  return std::isspace(c) != 0;
};

[[nodiscard]] inline auto trim(std::string_view s) -> std::string_view {
  auto start = std::ranges::find_if_not(s, is_space);
  auto end = std::ranges::find_if_not(s | std::views::reverse, is_space);
  if (start == s.end())
    return {};
  return {start, end.base()};
}

[[nodiscard]] inline auto ichar_equal(char a, char b) noexcept -> bool {
  return std::tolower(static_cast<unsigned char>(a)) ==
         std::tolower(static_cast<unsigned char>(b));
}

// Case-insensitive: does `s` begin with `prefix`?
[[nodiscard]] inline auto istarts_with(std::string_view s,
                                       std::string_view prefix) noexcept
    -> bool {
  return prefix.size() <= s.size() &&
         std::ranges::equal(s.substr(0, prefix.size()), prefix, ichar_equal);
}

// Splits on runs of whitespace; never yields empty parts.
[[nodiscard]] inline auto split_whitespace(std::string_view s)
    -> std::vector<std::string_view> {
  std::vector<std::string_view> result;
  auto it = s.begin();
  while (true) {
    it = std::find_if_not(it, s.end(), is_space);
    if (it == s.end())
      break;
    auto end = std::find_if(it, s.end(), is_space);
    result.emplace_back(it, end);
    it = end;
  }
  return result;
}

// Splits on every occurrence of `delim`, keeping empty parts.
[[nodiscard]] inline auto split_all(std::string_view s, char delim)
    -> std::vector<std::string_view> {
  std::vector<std::string_view> result;
  std::size_t start = 0;
  while (true) {
    auto end = s.find(delim, start);
    if (end == std::string_view::npos) {
      result.push_back(s.substr(start));
      return result;
    }
    result.push_back(s.substr(start, end - start));
    start = end + 1;
  }
}

[[nodiscard]] inline auto parse_int(std::string_view s) -> std::optional<int> {
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec == std::errc{} && ptr == s.data() + s.size()) {
    return value;
  }
  return std::nullopt;
}

}  // namespace cronfire
