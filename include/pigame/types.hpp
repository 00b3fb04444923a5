#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace pigame {

enum class PracticeMode {
  Standard,
  Timed,
  Chunk
};

inline std::string to_string(PracticeMode mode) {
  switch (mode) {
    case PracticeMode::Standard: return "standard";
    case PracticeMode::Timed: return "timed";
    case PracticeMode::Chunk: return "chunk";
  }
  return "standard";
}

inline PracticeMode practice_mode_from_string(const std::string& value) {
  if (value == "standard") {
    return PracticeMode::Standard;
  }
  if (value == "timed") {
    return PracticeMode::Timed;
  }
  if (value == "chunk") {
    return PracticeMode::Chunk;
  }
  throw std::invalid_argument("Unknown practice mode: " + value);
}

struct PracticeConfig {
  PracticeMode mode = PracticeMode::Standard;
  int min_digits = 5;
  int max_digits = 100;
  int chunk_size = 5;
  double time_limit_seconds = 60.0;
  bool visual_aid = true;

  // Throws InvalidConfig when an invariant does not hold.
  void validate() const;
};

enum class SessionEnd {
  Completed,
  Mismatch,
  Timeout,
  Interrupted
};

inline std::string to_string(SessionEnd end) {
  switch (end) {
    case SessionEnd::Completed: return "completed";
    case SessionEnd::Mismatch: return "mismatch";
    case SessionEnd::Timeout: return "timeout";
    case SessionEnd::Interrupted: return "interrupted";
  }
  return "interrupted";
}

struct SessionRecord {
  std::string timestamp;
  PracticeMode mode = PracticeMode::Standard;
  int digits_achieved = 0;
  double elapsed_seconds = 0.0;
  int error_count = 0;
  bool success = false;

  // Not persisted.
  SessionEnd end = SessionEnd::Interrupted;
  int target_digits = 0;
};

struct StatsAggregate {
  int session_count = 0;
  int best_digits_achieved = 0;
  std::optional<double> best_speed_digits_per_minute;

  int success_count = 0;
  long long total_digits_correct = 0;
  std::optional<std::string> last_session_timestamp;
  std::map<std::string, int> best_digits_by_mode;
};

} // namespace pigame
