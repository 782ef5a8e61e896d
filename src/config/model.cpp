#include "config/model.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <initializer_list>
#include <optional>
#include <vector>

namespace fs = std::filesystem;

namespace loadwatch::config {

namespace {

using JsonValue = core::json::Value;

std::optional<std::uint64_t> ReadU64Field(const JsonValue& root,
                                          std::initializer_list<std::string_view> path) {
  const JsonValue* value = core::json::FindPath(root, path);
  std::uint64_t count = 0;
  if (value == nullptr || !core::json::TryGetCount(*value, count)) {
    return std::nullopt;
  }
  return count;
}

std::optional<double> ReadNumberField(const JsonValue& root,
                                      std::initializer_list<std::string_view> path) {
  const JsonValue* value = core::json::FindPath(root, path);
  if (value == nullptr || !value->IsNumber() || !std::isfinite(value->number_value)) {
    return std::nullopt;
  }
  return value->number_value;
}

std::optional<std::string> ReadStringField(const JsonValue& root,
                                           std::initializer_list<std::string_view> path) {
  const JsonValue* value = core::json::FindPath(root, path);
  if (value == nullptr || !value->IsString()) {
    return std::nullopt;
  }
  return value->string_value;
}

std::optional<std::vector<std::string>>
ReadStringListField(const JsonValue& root, std::initializer_list<std::string_view> path) {
  const JsonValue* value = core::json::FindPath(root, path);
  if (value == nullptr || !value->IsArray()) {
    return std::nullopt;
  }
  std::vector<std::string> items;
  for (const JsonValue& item : value->array_value) {
    if (item.IsString()) {
      items.push_back(item.string_value);
    }
  }
  return items;
}

template <typename T>
void Assign(T& target, const std::optional<T>& value) {
  if (value.has_value()) {
    target = *value;
  }
}

void AssignU32(std::uint32_t& target, const std::optional<std::uint64_t>& value) {
  if (value.has_value()) {
    target = static_cast<std::uint32_t>(*value);
  }
}

void ParseConfigRoot(const JsonValue& root, AppConfig& config) {
  Assign(config.instance_id, ReadStringField(root, {"instance_id"}));

  Assign(config.upstream.backend, ReadStringField(root, {"upstream", "backend"}));
  if (const auto replay = ReadStringField(root, {"upstream", "replay_path"}); replay.has_value()) {
    config.upstream.replay_path = *replay;
  }

  dispatch::SearchCriteria& criteria = config.search_criteria;
  Assign(criteria.min_total_miles, ReadNumberField(root, {"search_criteria", "min_total_miles"}));
  Assign(criteria.max_deadhead_miles,
         ReadNumberField(root, {"search_criteria", "max_deadhead_miles"}));
  Assign(criteria.excluded_regions,
         ReadStringListField(root, {"search_criteria", "excluded_regions"}));

  loads::EstimatorConfig& estimator = config.estimator;
  Assign(estimator.base_rate_per_mile, ReadNumberField(root, {"estimator", "base_rate_per_mile"}));
  Assign(estimator.min_rate_per_mile, ReadNumberField(root, {"estimator", "min_rate_per_mile"}));
  Assign(estimator.mpg, ReadNumberField(root, {"estimator", "mpg"}));
  Assign(estimator.fuel_price, ReadNumberField(root, {"estimator", "fuel_price"}));
  Assign(estimator.preferred_equipment,
         ReadStringListField(root, {"estimator", "preferred_equipment"}));

  AssignU32(config.dispatch.max_in_flight, ReadU64Field(root, {"dispatch", "max_in_flight"}));
  Assign(config.dispatch.shutdown_grace_s,
         ReadNumberField(root, {"dispatch", "shutdown_grace_s"}));

  AssignU32(config.recovery.max_attempts, ReadU64Field(root, {"recovery", "max_attempts"}));
  Assign(config.recovery.base_delay_s, ReadNumberField(root, {"recovery", "base_delay_s"}));
  Assign(config.recovery.cooldown_s, ReadNumberField(root, {"recovery", "cooldown_s"}));
  Assign(config.recovery.diagnostics_max_age_s,
         ReadNumberField(root, {"recovery", "diagnostics_max_age_s"}));

  Assign(config.scheduler.max_cycles, ReadU64Field(root, {"scheduler", "max_cycles"}));
  AssignU32(config.scheduler.status_every_cycles,
            ReadU64Field(root, {"scheduler", "status_every_cycles"}));
  Assign(config.scheduler.alert_interval_s,
         ReadNumberField(root, {"scheduler", "alert_interval_s"}));

  AssignU32(config.retention.days, ReadU64Field(root, {"retention", "days"}));
  Assign(config.retention.sweep_interval_s,
         ReadNumberField(root, {"retention", "sweep_interval_s"}));

  if (const auto state_dir = ReadStringField(root, {"paths", "state_dir"});
      state_dir.has_value() && !state_dir->empty()) {
    config.paths.state_dir = *state_dir;
  }
  if (const auto diagnostics = ReadStringField(root, {"paths", "diagnostics_dir"});
      diagnostics.has_value()) {
    config.paths.diagnostics_dir = *diagnostics;
  }
}

} // namespace

StatePaths ResolveStatePaths(const AppConfig& config) {
  const fs::path& root = config.paths.state_dir;
  return StatePaths{
      .events_jsonl = root / "events.jsonl",
      .status_json = root / "status.json",
      .sent_records_jsonl = root / "sent_records.jsonl",
      .outbox_jsonl = root / "outbox.jsonl",
      .alerts_jsonl = root / "alerts.jsonl",
      .diagnostics_dir = config.paths.diagnostics_dir.empty() ? root / "diagnostics"
                                                              : config.paths.diagnostics_dir,
  };
}

bool ParseConfigText(std::string_view json_text, AppConfig& config, std::string& error) {
  config = AppConfig{};
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "invalid config JSON: " + parse_error;
    return false;
  }
  if (!root.IsObject()) {
    error = "config root must be a JSON object";
    return false;
  }

  ParseConfigRoot(root, config);
  return true;
}

bool LoadConfigFile(const fs::path& config_path, AppConfig& config, std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(config_path, contents, error)) {
    return false;
  }
  if (!ParseConfigText(contents, config, error)) {
    return false;
  }
  if (!config.upstream.replay_path.empty() && config.upstream.replay_path.is_relative()) {
    config.upstream.replay_path = config_path.parent_path() / config.upstream.replay_path;
  }
  return true;
}

} // namespace loadwatch::config
