#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pigame {

struct DiffResult {
  // One entry per position in the overlap of reference and user input.
  std::vector<bool> matches;
  std::vector<std::size_t> mismatch_positions;
  // User characters past the end of the reference.
  std::size_t surplus = 0;
  int error_count = 0;
  bool all_match = false;
};

DiffResult compare(std::string_view reference, std::string_view user);

struct Match {};

struct Mismatch {
  char expected;
  char actual;
};

using StepResult = std::variant<Match, Mismatch>;

class StreamingComparator {
public:
  explicit StreamingComparator(std::string_view reference);

  // Compares `actual` with the next reference character and advances.
  // Throws OutOfRange once the reference is exhausted.
  StepResult feed(char actual);

  std::size_t position() const noexcept { return position_; }
  int error_count() const noexcept { return error_count_; }
  bool exhausted() const noexcept { return position_ >= reference_.size(); }
  std::string_view reference() const noexcept { return reference_; }

private:
  std::string_view reference_;
  std::size_t position_ = 0;
  int error_count_ = 0;
};

} // namespace pigame
