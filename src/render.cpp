#include "pigame/render.hpp"

#include "pigame/digit_source.hpp"
#include "pigame/stats_store.hpp"

#include <iomanip>
#include <sstream>

namespace pigame {
namespace {

constexpr const char* kRed = "\033[0;31m";
constexpr const char* kUnderline = "\033[4m";
constexpr const char* kReset = "\033[0m";

} // namespace

std::string render_diff(const std::string& guess, const DiffResult& diff, bool colorblind) {
  std::ostringstream oss;
  const auto point = guess.find('.');
  const std::size_t group_start = point == std::string::npos ? 0 : point + 1;
  for (std::size_t i = 0; i < guess.size(); ++i) {
    if (i > group_start && (i - group_start) % 5 == 0) {
      oss << ' ';
    }
    const bool correct = i < diff.matches.size() && diff.matches[i];
    if (correct) {
      oss << guess[i];
    } else {
      oss << (colorblind ? kUnderline : kRed) << guess[i] << kReset;
    }
  }
  return oss.str();
}

std::string render_evaluation(const Evaluation& evaluation, bool verbose, bool colorblind) {
  std::ostringstream oss;
  const auto grouped = group_digits(evaluation.reference);
  if (verbose) {
    oss << "π with " << evaluation.decimals << " decimals:\t" << grouped << "\n";
    oss << "Your version of π:\t" << render_diff(evaluation.guess, evaluation.diff, colorblind)
        << "\n";
    oss << "Number of errors: " << evaluation.diff.error_count << "\n";
    if (evaluation.diff.all_match) {
      oss << (evaluation.decimals < kDefaultDisplayDigits ? "Well done." : "Perfect!") << "\n";
    } else {
      oss << "You can do better!\n";
    }
  } else {
    oss << grouped << "\n";
    oss << render_diff(evaluation.guess, evaluation.diff, colorblind) << "\n";
    oss << (evaluation.diff.all_match ? "Match" : "No match") << "\n";
  }
  return oss.str();
}

std::string render_stats(const std::vector<SessionRecord>& history) {
  if (history.empty()) {
    return "No practice sessions recorded yet.\n";
  }
  const auto stats = aggregate(history);
  std::ostringstream oss;
  oss << "Practice statistics\n";
  oss << "  Sessions:        " << stats.session_count << " (" << stats.success_count
      << " completed)\n";
  oss << "  Best digits:     " << stats.best_digits_achieved << "\n";
  oss << "  Best speed:      ";
  if (stats.best_speed_digits_per_minute.has_value()) {
    oss << std::fixed << std::setprecision(1) << *stats.best_speed_digits_per_minute
        << " digits/min\n";
  } else {
    oss << "n/a\n";
  }
  oss << "  Digits recalled: " << stats.total_digits_correct << "\n";
  if (stats.last_session_timestamp.has_value()) {
    oss << "  Last session:    " << *stats.last_session_timestamp << "\n";
  }
  oss << "  Best by mode:   ";
  for (const auto& [mode, best] : stats.best_digits_by_mode) {
    oss << " " << mode << "=" << best;
  }
  oss << "\n";
  return oss.str();
}

} // namespace pigame
