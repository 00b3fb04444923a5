#include "pigame/evaluate.hpp"

#include "pigame/digit_source.hpp"
#include "pigame/errors.hpp"

#include <cctype>

namespace pigame {

bool is_numeric_guess(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  const auto point = text.find('.');
  const auto all_digits = [](std::string_view part) {
    if (part.empty()) {
      return false;
    }
    for (char c : part) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        return false;
      }
    }
    return true;
  };
  if (point == std::string_view::npos) {
    return all_digits(text);
  }
  return all_digits(text.substr(0, point)) && all_digits(text.substr(point + 1));
}

DiffResult evaluate(std::string_view reference, std::string_view user_input) {
  if (!is_numeric_guess(reference)) {
    throw InvalidInput("Invalid reference - NOT a float: '" + std::string(reference) + "'");
  }
  if (!is_numeric_guess(user_input)) {
    throw InvalidInput("Invalid input - NOT a float: '" + std::string(user_input) + "'");
  }
  return compare(reference, user_input);
}

Evaluation evaluate_guess(const std::string& guess, std::optional<int> decimals) {
  if (!is_numeric_guess(guess)) {
    throw InvalidInput("Invalid input - NOT a float");
  }
  Evaluation out;
  if (decimals.has_value()) {
    out.decimals = *decimals;
  } else {
    const int derived = static_cast<int>(guess.size()) - 2;
    out.decimals = derived < 1 ? 1 : derived;
  }
  out.reference = DigitSource::pi_string(out.decimals);
  out.guess = guess;
  out.diff = evaluate(out.reference, out.guess);
  return out;
}

bool is_easter_egg(std::string_view text) {
  return text == "Archimedes" || text == "pi" || text == "PI";
}

std::string easter_egg_text() {
  return "π is also called Archimedes constant and is commonly defined as\n"
         "the ratio of a circles circumference C to its diameter d:\n"
         "π = C / d\n";
}

} // namespace pigame
