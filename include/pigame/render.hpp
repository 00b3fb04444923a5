#pragma once

#include "diff_engine.hpp"
#include "evaluate.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace pigame {

// Wrong digits in red, or underlined in colour-blind mode. Decimals are
// grouped by five.
std::string render_diff(const std::string& guess, const DiffResult& diff, bool colorblind);

// Full output of the evaluate command, one line per row.
std::string render_evaluation(const Evaluation& evaluation, bool verbose, bool colorblind);

std::string render_stats(const std::vector<SessionRecord>& history);

} // namespace pigame
