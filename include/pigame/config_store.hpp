#pragma once

#include "types.hpp"

#include <filesystem>
#include <utility>

namespace pigame {

class ConfigRepository {
public:
  virtual ~ConfigRepository() = default;

  // Defaults when nothing is stored. Throws InvalidConfig when the stored
  // configuration is malformed or breaks an invariant.
  virtual PracticeConfig load() = 0;

  // Validates, then persists. Throws InvalidConfig or StorageError.
  virtual void save(const PracticeConfig& config) = 0;
};

// JSON object mirroring PracticeConfig, e.g. ~/.pigame/config.json.
class JsonConfigRepository : public ConfigRepository {
public:
  explicit JsonConfigRepository(std::filesystem::path path);

  PracticeConfig load() override;
  void save(const PracticeConfig& config) override;

  const std::filesystem::path& path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

class InMemoryConfigRepository : public ConfigRepository {
public:
  InMemoryConfigRepository() = default;
  explicit InMemoryConfigRepository(PracticeConfig config) : config_(std::move(config)) {}

  PracticeConfig load() override { return config_; }
  void save(const PracticeConfig& config) override;

private:
  PracticeConfig config_;
};

// $PIGAME_HOME when set, otherwise $HOME/.pigame.
std::filesystem::path default_data_dir();

std::filesystem::path default_stats_path();
std::filesystem::path default_config_path();

} // namespace pigame
