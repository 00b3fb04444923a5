#include "pigame/diff_engine.hpp"

#include "pigame/errors.hpp"

#include <algorithm>
#include <string>

namespace pigame {

DiffResult compare(std::string_view reference, std::string_view user) {
  DiffResult result;
  const std::size_t overlap = std::min(reference.size(), user.size());
  result.matches.reserve(overlap);
  for (std::size_t i = 0; i < overlap; ++i) {
    const bool same = reference[i] == user[i];
    result.matches.push_back(same);
    if (!same) {
      result.mismatch_positions.push_back(i);
    }
  }
  result.surplus = user.size() > reference.size() ? user.size() - reference.size() : 0;
  result.error_count = static_cast<int>(result.mismatch_positions.size() + result.surplus);
  result.all_match = result.mismatch_positions.empty() && reference.size() == user.size();
  return result;
}

StreamingComparator::StreamingComparator(std::string_view reference) : reference_(reference) {}

StepResult StreamingComparator::feed(char actual) {
  if (exhausted()) {
    throw OutOfRange("Streaming comparison ran past the reference (" +
                     std::to_string(reference_.size()) + " digits)");
  }
  const char expected = reference_[position_++];
  if (expected == actual) {
    return Match{};
  }
  ++error_count_;
  return Mismatch{expected, actual};
}

} // namespace pigame
