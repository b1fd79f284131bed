#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <vector>

namespace brdoc::core {

// Locale-independent ASCII digit helpers. std::isdigit is avoided on purpose:
// its result depends on the current C locale and it is undefined for negative chars.

[[nodiscard]] constexpr bool is_ascii_digit(const char ch) { return ch >= '0' && ch <= '9'; }

// digit_value returns 0..9 for an ASCII digit, nullopt for anything else.
[[nodiscard]] constexpr std::optional<std::uint8_t> digit_value(const char ch) {
  if (!is_ascii_digit(ch)) {
    return std::nullopt;
  }
  return static_cast<std::uint8_t>(ch - '0');
}

[[nodiscard]] constexpr char digit_char(const std::uint8_t value) {
  return static_cast<char>('0' + value);
}

// all_equal reports whether every element of a non-empty sequence is identical.
// An empty sequence is not considered uniform.
[[nodiscard]] inline bool all_equal(const std::vector<std::uint8_t>& values) {
  if (values.empty()) {
    return false;
  }
  return std::all_of(values.begin(), values.end(),
                     [first = values.front()](std::uint8_t v) { return v == first; });
}

}  // namespace brdoc::core
