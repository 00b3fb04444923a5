#include "pigame/difficulty.hpp"

#include <algorithm>

namespace pigame {

int compute_start_digits(const StatsAggregate& aggregate, const PracticeConfig& config) {
  const int floor = std::max(config.min_digits, aggregate.best_digits_achieved);
  // An unvalidated config with min > max still lands on max_digits.
  return std::min(floor, config.max_digits);
}

} // namespace pigame
