#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace payledger {
namespace common {

// Fixed-point money: a count of ten-thousandths (0.0001).
using Amount = std::int64_t;

inline constexpr int kAmountDecimals = 4;
inline constexpr Amount kAmountScale = 10'000;

// Parses "[+-]digits[.digits]". Fraction digits past the fourth are rounded
// half away from zero. Returns nullopt on malformed text or overflow.
inline std::optional<Amount> parse_amount(std::string_view text) noexcept {
  constexpr Amount kMaxWhole = std::numeric_limits<Amount>::max() / kAmountScale - 1;

  std::size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    negative = text[pos] == '-';
    ++pos;
  }

  bool any_digit = false;
  Amount whole = 0;
  while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
    whole = whole * 10 + (text[pos] - '0');
    if (whole > kMaxWhole) {
      return std::nullopt;
    }
    any_digit = true;
    ++pos;
  }

  Amount fraction = 0;
  int fraction_digits = 0;
  bool round_up = false;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    bool rounding_digit_seen = false;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      const int digit = text[pos] - '0';
      if (fraction_digits < kAmountDecimals) {
        fraction = fraction * 10 + digit;
        ++fraction_digits;
      } else if (!rounding_digit_seen) {
        round_up = digit >= 5;
        rounding_digit_seen = true;
      }
      any_digit = true;
      ++pos;
    }
  }

  if (!any_digit || pos != text.size()) {
    return std::nullopt;
  }

  for (; fraction_digits < kAmountDecimals; ++fraction_digits) {
    fraction *= 10;
  }

  const Amount magnitude = whole * kAmountScale + fraction + (round_up ? 1 : 0);
  return negative ? -magnitude : magnitude;
}

// Always four fraction digits: 60000 -> "6.0000", -15000 -> "-1.5000".
inline std::string format_amount(Amount amount) {
  const bool negative = amount < 0;
  const std::uint64_t magnitude = negative ? 0 - static_cast<std::uint64_t>(amount)
                                           : static_cast<std::uint64_t>(amount);
  const auto scale = static_cast<std::uint64_t>(kAmountScale);

  std::string fraction = std::to_string(magnitude % scale);
  fraction.insert(0, static_cast<std::size_t>(kAmountDecimals) - fraction.size(), '0');

  std::string text = negative ? "-" : "";
  text += std::to_string(magnitude / scale);
  text += '.';
  text += fraction;
  return text;
}

}  // namespace common
}  // namespace payledger
