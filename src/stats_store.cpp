#include "pigame/stats_store.hpp"

#include "pigame/errors.hpp"
#include "file_io.hpp"
#include "json_bridge.hpp"
#include "log.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace pigame {

JsonStatsRepository::JsonStatsRepository(std::filesystem::path path) : path_(std::move(path)) {}

std::optional<std::vector<SessionRecord>> JsonStatsRepository::read_history() const {
  std::optional<std::string> content;
  try {
    content = io::read_file(path_);
  } catch (const StorageError& ex) {
    throw StatsCorrupt(ex.what());
  }
  if (!content.has_value()) {
    return std::nullopt;
  }
  try {
    return bridge::history_from_json(nlohmann::json::parse(*content));
  } catch (const nlohmann::json::exception& ex) {
    throw StatsCorrupt("Malformed stats file " + path_.string() + ": " + ex.what());
  } catch (const std::invalid_argument& ex) {
    throw StatsCorrupt("Malformed stats file " + path_.string() + ": " + ex.what());
  }
}

std::vector<SessionRecord> JsonStatsRepository::load() {
  try {
    auto history = read_history();
    if (!history.has_value()) {
      log::debug("stats", "no history at " + path_.string());
      return {};
    }
    log::debug("stats", "loaded " + std::to_string(history->size()) + " records");
    return std::move(*history);
  } catch (const StatsCorrupt& ex) {
    log::warning("stats", std::string(ex.what()) + "; using empty history");
    return {};
  }
}

void JsonStatsRepository::append(const SessionRecord& record) {
  std::vector<SessionRecord> history;
  try {
    auto existing = read_history();
    if (existing.has_value()) {
      history = std::move(*existing);
    }
  } catch (const StatsCorrupt& ex) {
    auto backup = path_;
    backup += ".corrupt";
    std::error_code ec;
    std::filesystem::rename(path_, backup, ec);
    if (ec) {
      log::warning("stats", std::string(ex.what()) + "; could not keep a backup: " + ec.message());
    } else {
      log::warning("stats", std::string(ex.what()) + "; moved to " + backup.string());
    }
  }
  history.push_back(record);
  io::write_file_atomic(path_, bridge::to_json(history).dump(2) + "\n");
  log::debug("stats", "appended record, " + std::to_string(history.size()) + " total");
}

InMemoryStatsRepository::InMemoryStatsRepository(std::vector<SessionRecord> history)
    : history_(std::move(history)) {}

std::optional<double> digits_per_minute(const SessionRecord& record) {
  if (record.elapsed_seconds <= 0.0) {
    return std::nullopt;
  }
  return static_cast<double>(record.digits_achieved) / (record.elapsed_seconds / 60.0);
}

StatsAggregate aggregate(const std::vector<SessionRecord>& history) {
  StatsAggregate out;
  for (const auto& record : history) {
    ++out.session_count;
    out.best_digits_achieved = std::max(out.best_digits_achieved, record.digits_achieved);
    if (const auto speed = digits_per_minute(record)) {
      if (!out.best_speed_digits_per_minute.has_value() ||
          *speed > *out.best_speed_digits_per_minute) {
        out.best_speed_digits_per_minute = speed;
      }
    }
    if (record.success) {
      ++out.success_count;
    }
    out.total_digits_correct += record.digits_achieved;
    // ISO-8601 UTC stamps order lexicographically.
    if (!out.last_session_timestamp.has_value() ||
        record.timestamp > *out.last_session_timestamp) {
      out.last_session_timestamp = record.timestamp;
    }
    auto& best = out.best_digits_by_mode[to_string(record.mode)];
    best = std::max(best, record.digits_achieved);
  }
  return out;
}

} // namespace pigame
