#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace pigame {

// Evaluate and show commands fall back to this many decimals.
inline constexpr int kDefaultDisplayDigits = 15;

class DigitSource {
public:
  // First `length` decimals of pi (the digits after "3.").
  // Throws OutOfRange unless 1 <= length <= max_digits().
  static std::string_view digits(int length);

  static int max_digits() noexcept;

  // "3." followed by digits(length).
  static std::string pi_string(int length);
};

// Inserts a space after every `group` decimals. Text before the decimal
// point is left alone; text without a point is grouped from the start.
std::string group_digits(std::string_view text, std::size_t group = 5);

} // namespace pigame
