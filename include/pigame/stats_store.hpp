#pragma once

#include "types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pigame {

class StatsRepository {
public:
  virtual ~StatsRepository() = default;

  // Full history in append order. Missing or corrupt storage yields an
  // empty history.
  virtual std::vector<SessionRecord> load() = 0;

  // Durable, all-or-nothing. Throws StorageError on failure.
  virtual void append(const SessionRecord& record) = 0;
};

// JSON array of records, e.g. ~/.pigame/stats.json.
class JsonStatsRepository : public StatsRepository {
public:
  explicit JsonStatsRepository(std::filesystem::path path);

  std::vector<SessionRecord> load() override;
  void append(const SessionRecord& record) override;

  const std::filesystem::path& path() const noexcept { return path_; }

private:
  // Throws StatsCorrupt for unreadable or malformed contents.
  std::optional<std::vector<SessionRecord>> read_history() const;

  std::filesystem::path path_;
};

class InMemoryStatsRepository : public StatsRepository {
public:
  InMemoryStatsRepository() = default;
  explicit InMemoryStatsRepository(std::vector<SessionRecord> history);

  std::vector<SessionRecord> load() override { return history_; }
  void append(const SessionRecord& record) override { history_.push_back(record); }

private:
  std::vector<SessionRecord> history_;
};

StatsAggregate aggregate(const std::vector<SessionRecord>& history);

// Digits per minute, or nullopt when elapsed time is not positive.
std::optional<double> digits_per_minute(const SessionRecord& record);

} // namespace pigame
