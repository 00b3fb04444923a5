#pragma once

#include "diff_engine.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace pigame {

struct Evaluation {
  int decimals = 0;
  std::string reference;
  std::string guess;
  DiffResult diff;
};

// Digits with an optional single fractional part: "3", "3.14", "14159".
bool is_numeric_guess(std::string_view text);

// Positional comparison of two digit strings. Throws InvalidInput when
// either side is not numeric.
DiffResult evaluate(std::string_view reference, std::string_view user_input);

// Compares a guess such as "3.14159" against pi. Without `decimals` the
// reference length follows the guess: len - 2, at least 1.
Evaluation evaluate_guess(const std::string& guess, std::optional<int> decimals = std::nullopt);

bool is_easter_egg(std::string_view text);
std::string easter_egg_text();

} // namespace pigame
