#include "pigame/digit_source.hpp"

#include "pigame/errors.hpp"
#include "resources/pi_digits_builtin.hpp"

#include <string>

namespace pigame {

std::string_view DigitSource::digits(int length) {
  if (length < 1 || length > max_digits()) {
    throw OutOfRange("Requested " + std::to_string(length) +
                     " digits of pi; supported range is 1.." +
                     std::to_string(max_digits()));
  }
  return std::string_view(builtin::PiDigits::kDecimals, static_cast<std::size_t>(length));
}

int DigitSource::max_digits() noexcept {
  return static_cast<int>(builtin::PiDigits::kCount);
}

std::string DigitSource::pi_string(int length) {
  std::string out = "3.";
  out.append(digits(length));
  return out;
}

std::string group_digits(std::string_view text, std::size_t group) {
  if (group == 0) {
    return std::string(text);
  }
  std::size_t start = 0;
  const auto point = text.find('.');
  if (point != std::string_view::npos) {
    start = point + 1;
  }
  std::string out(text.substr(0, start));
  out.reserve(text.size() + text.size() / group);
  for (std::size_t i = start; i < text.size(); ++i) {
    if (i > start && (i - start) % group == 0) {
      out.push_back(' ');
    }
    out.push_back(text[i]);
  }
  return out;
}

} // namespace pigame
