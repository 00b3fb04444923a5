#include "pigame/config_store.hpp"

#include "pigame/digit_source.hpp"
#include "pigame/errors.hpp"
#include "file_io.hpp"
#include "json_bridge.hpp"
#include "log.hpp"

#include <cmath>
#include <cstdlib>
#include <string>

namespace pigame {

void PracticeConfig::validate() const {
  if (min_digits < 1) {
    throw InvalidConfig("min_digits must be at least 1");
  }
  if (min_digits > max_digits) {
    throw InvalidConfig("min_digits must not exceed max_digits");
  }
  if (max_digits > DigitSource::max_digits()) {
    throw InvalidConfig("max_digits must not exceed " + std::to_string(DigitSource::max_digits()));
  }
  if (chunk_size <= 0) {
    throw InvalidConfig("chunk_size must be greater than 0");
  }
  if (!std::isfinite(time_limit_seconds) || time_limit_seconds <= 0.0) {
    throw InvalidConfig("time_limit_seconds must be greater than 0");
  }
}

JsonConfigRepository::JsonConfigRepository(std::filesystem::path path) : path_(std::move(path)) {}

PracticeConfig JsonConfigRepository::load() {
  std::optional<std::string> content;
  try {
    content = io::read_file(path_);
  } catch (const StorageError& ex) {
    throw InvalidConfig(ex.what());
  }
  if (!content.has_value()) {
    log::debug("config", "no config at " + path_.string() + ", using defaults");
    return PracticeConfig{};
  }
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(*content);
  } catch (const nlohmann::json::exception& ex) {
    throw InvalidConfig("Malformed config file " + path_.string() + ": " + ex.what());
  }
  try {
    return bridge::practice_config_from_json(document);
  } catch (const InvalidConfig& ex) {
    throw InvalidConfig("Invalid config file " + path_.string() + ": " + ex.what());
  }
}

void JsonConfigRepository::save(const PracticeConfig& config) {
  config.validate();
  io::write_file_atomic(path_, bridge::to_json(config).dump(2) + "\n");
  log::debug("config", "saved " + path_.string());
}

void InMemoryConfigRepository::save(const PracticeConfig& config) {
  config.validate();
  config_ = config;
}

std::filesystem::path default_data_dir() {
  if (const char* home = std::getenv("PIGAME_HOME"); home && *home) {
    return std::filesystem::path(home);
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".pigame";
  }
  return std::filesystem::current_path() / ".pigame";
}

std::filesystem::path default_stats_path() {
  return default_data_dir() / "stats.json";
}

std::filesystem::path default_config_path() {
  return default_data_dir() / "config.json";
}

} // namespace pigame
