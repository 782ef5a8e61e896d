#pragma once

#include "dispatch/search_criteria.hpp"
#include "loads/profitability.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace loadwatch::config {

// Parsed application config. Every field carries a default, so a minimal
// config names only the upstream fixture.
//
// Parsing is lenient (wrong types leave the default in place); the validator
// is the strict gate and runs first on every CLI path.
struct AppConfig {
  std::string instance_id = "loadwatch";

  struct Upstream {
    std::string backend = "replay";
    // Relative paths resolve against the config file's directory.
    std::filesystem::path replay_path;
  } upstream;

  dispatch::SearchCriteria search_criteria;
  loads::EstimatorConfig estimator;

  struct Dispatch {
    std::uint32_t max_in_flight = 5;
    double shutdown_grace_s = 10.0;
  } dispatch;

  struct Recovery {
    std::uint32_t max_attempts = 3;
    double base_delay_s = 30.0;
    double cooldown_s = 300.0;
    double diagnostics_max_age_s = 3600.0;
  } recovery;

  struct Scheduler {
    // 0 runs until shutdown or escalation.
    std::uint64_t max_cycles = 0;
    std::uint32_t status_every_cycles = 10;
    // Minimum spacing of degraded-health alerts.
    double alert_interval_s = 1800.0;
  } scheduler;

  struct Retention {
    std::uint32_t days = 7;
    double sweep_interval_s = 3600.0;
  } retention;

  struct Paths {
    std::filesystem::path state_dir = "loadwatch_state";
    // Defaults to <state_dir>/diagnostics when empty.
    std::filesystem::path diagnostics_dir;
  } paths;
};

// Layout of files under the state directory.
struct StatePaths {
  std::filesystem::path events_jsonl;
  std::filesystem::path status_json;
  std::filesystem::path sent_records_jsonl;
  std::filesystem::path outbox_jsonl;
  std::filesystem::path alerts_jsonl;
  std::filesystem::path diagnostics_dir;
};

StatePaths ResolveStatePaths(const AppConfig& config);

bool ParseConfigText(std::string_view json_text, AppConfig& config, std::string& error);

// Loads a config file; relative replay paths are resolved against its
// directory.
bool LoadConfigFile(const std::filesystem::path& config_path, AppConfig& config,
                    std::string& error);

} // namespace loadwatch::config
