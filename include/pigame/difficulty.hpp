#pragma once

#include "types.hpp"

namespace pigame {

// Starting target for the next session: the historical best, never below
// config.min_digits and never above config.max_digits.
int compute_start_digits(const StatsAggregate& aggregate, const PracticeConfig& config);

} // namespace pigame
