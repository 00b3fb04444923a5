#pragma once

#include "pigame/types.hpp"

#include <vector>

#include <nlohmann/json.hpp>

namespace pigame::bridge {

nlohmann::json to_json(const SessionRecord& record);
SessionRecord session_record_from_json(const nlohmann::json& json_record);

nlohmann::json to_json(const std::vector<SessionRecord>& history);
std::vector<SessionRecord> history_from_json(const nlohmann::json& json_history);

nlohmann::json to_json(const PracticeConfig& config);
// Absent keys keep their defaults; the result is validated.
PracticeConfig practice_config_from_json(const nlohmann::json& json_config);

nlohmann::json to_json(const StatsAggregate& aggregate);

} // namespace pigame::bridge
