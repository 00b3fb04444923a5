#include "json_bridge.hpp"

#include "pigame/errors.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pigame::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj.at(key);
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

const nlohmann::json& require_field(const nlohmann::json& obj, const char* key) {
  if (!obj.contains(key) || obj.at(key).is_null()) {
    throw std::invalid_argument("Missing field '" + std::string(key) + "'");
  }
  return obj.at(key);
}

int json_to_int(const nlohmann::json& value, std::string_view key) {
  constexpr auto lowest = std::numeric_limits<int>::min();
  constexpr auto highest = std::numeric_limits<int>::max();
  if (value.is_number_unsigned()) {
    const auto raw = value.get<std::uint64_t>();
    if (raw <= static_cast<std::uint64_t>(highest)) {
      return static_cast<int>(raw);
    }
  } else if (value.is_number_integer()) {
    const auto raw = value.get<std::int64_t>();
    if (raw >= lowest && raw <= highest) {
      return static_cast<int>(raw);
    }
  } else if (value.is_number_float()) {
    const double raw = value.get<double>();
    if (std::floor(raw) != raw) {
      throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
    }
    if (raw >= static_cast<double>(lowest) && raw <= static_cast<double>(highest)) {
      return static_cast<int>(raw);
    }
  } else {
    throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
  }
  throw std::invalid_argument("Integer out of range for field '" + std::string(key) + "'");
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

bool json_to_bool(const nlohmann::json& value, std::string_view key) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  throw std::invalid_argument("Expected bool for field '" + std::string(key) + "'");
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

} // namespace

nlohmann::json to_json(const SessionRecord& record) {
  nlohmann::json json = nlohmann::json::object();
  json["timestamp"] = record.timestamp;
  json["mode"] = to_string(record.mode);
  json["digits"] = record.digits_achieved;
  json["elapsed_seconds"] = record.elapsed_seconds;
  json["errors"] = record.error_count;
  json["success"] = record.success;
  return json;
}

SessionRecord session_record_from_json(const nlohmann::json& json_record) {
  if (!json_record.is_object()) {
    throw std::invalid_argument("Session record must be a JSON object");
  }
  SessionRecord record;
  record.timestamp = json_to_string(require_field(json_record, "timestamp"), "timestamp");
  record.mode = practice_mode_from_string(json_to_string(require_field(json_record, "mode"), "mode"));
  record.digits_achieved = json_to_int(require_field(json_record, "digits"), "digits");
  record.elapsed_seconds =
      json_to_double(require_field(json_record, "elapsed_seconds"), "elapsed_seconds");
  record.error_count = json_to_int(require_field(json_record, "errors"), "errors");
  record.success = json_to_bool(require_field(json_record, "success"), "success");
  if (record.digits_achieved < 0 || record.elapsed_seconds < 0.0 || record.error_count < 0) {
    throw std::invalid_argument("Session record holds negative values");
  }
  record.end = record.success ? SessionEnd::Completed
                              : (record.error_count > 0 ? SessionEnd::Mismatch
                                                        : SessionEnd::Interrupted);
  return record;
}

nlohmann::json to_json(const std::vector<SessionRecord>& history) {
  nlohmann::json json = nlohmann::json::array();
  for (const auto& record : history) {
    json.push_back(to_json(record));
  }
  return json;
}

std::vector<SessionRecord> history_from_json(const nlohmann::json& json_history) {
  if (!json_history.is_array()) {
    throw std::invalid_argument("Session history must be a JSON array");
  }
  std::vector<SessionRecord> history;
  history.reserve(json_history.size());
  for (const auto& entry : json_history) {
    history.push_back(session_record_from_json(entry));
  }
  return history;
}

nlohmann::json to_json(const PracticeConfig& config) {
  nlohmann::json json = nlohmann::json::object();
  json["mode"] = to_string(config.mode);
  json["min_digits"] = config.min_digits;
  json["max_digits"] = config.max_digits;
  json["chunk_size"] = config.chunk_size;
  json["time_limit_seconds"] = config.time_limit_seconds;
  json["visual_aid"] = config.visual_aid;
  return json;
}

PracticeConfig practice_config_from_json(const nlohmann::json& json_config) {
  if (!json_config.is_object()) {
    throw InvalidConfig("Practice configuration must be a JSON object");
  }
  PracticeConfig config;
  try {
    assign_if_present(json_config, "mode", [&](const nlohmann::json& value) {
      config.mode = practice_mode_from_string(json_to_string(value, "mode"));
    });
    assign_if_present(json_config, "min_digits", [&](const nlohmann::json& value) {
      config.min_digits = json_to_int(value, "min_digits");
    });
    assign_if_present(json_config, "max_digits", [&](const nlohmann::json& value) {
      config.max_digits = json_to_int(value, "max_digits");
    });
    assign_if_present(json_config, "chunk_size", [&](const nlohmann::json& value) {
      config.chunk_size = json_to_int(value, "chunk_size");
    });
    assign_if_present(json_config, "time_limit_seconds", [&](const nlohmann::json& value) {
      config.time_limit_seconds = json_to_double(value, "time_limit_seconds");
    });
    assign_if_present(json_config, "visual_aid", [&](const nlohmann::json& value) {
      config.visual_aid = json_to_bool(value, "visual_aid");
    });
  } catch (const InvalidConfig&) {
    throw;
  } catch (const std::invalid_argument& ex) {
    throw InvalidConfig(ex.what());
  }
  config.validate();
  return config;
}

nlohmann::json to_json(const StatsAggregate& aggregate) {
  nlohmann::json json = nlohmann::json::object();
  json["session_count"] = aggregate.session_count;
  json["best_digits"] = aggregate.best_digits_achieved;
  if (aggregate.best_speed_digits_per_minute.has_value()) {
    json["best_speed_digits_per_minute"] = *aggregate.best_speed_digits_per_minute;
  } else {
    json["best_speed_digits_per_minute"] = nullptr;
  }
  json["success_count"] = aggregate.success_count;
  json["total_digits_correct"] = aggregate.total_digits_correct;
  if (aggregate.last_session_timestamp.has_value()) {
    json["last_session"] = *aggregate.last_session_timestamp;
  } else {
    json["last_session"] = nullptr;
  }
  nlohmann::json by_mode = nlohmann::json::object();
  for (const auto& [mode, best] : aggregate.best_digits_by_mode) {
    by_mode[mode] = best;
  }
  json["best_digits_by_mode"] = std::move(by_mode);
  return json;
}

} // namespace pigame::bridge
