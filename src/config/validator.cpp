#include "config/validator.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <set>
#include <utility>

namespace loadwatch::config {

namespace {

using JsonValue = core::json::Value;

const std::set<std::string>& KnownSections() {
  static const std::set<std::string> kSections = {
      "instance_id", "upstream",  "search_criteria", "estimator", "dispatch",
      "recovery",    "scheduler", "retention",       "paths",
  };
  return kSections;
}

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

// Returns the section object, or nullptr when absent. Wrong types are reported.
const JsonValue* Section(const JsonValue& root, std::string_view key, ValidationReport& report) {
  const JsonValue* section = root.Find(key);
  if (section != nullptr && !section->IsObject()) {
    AddIssue(report, std::string(key), "must be an object");
    return nullptr;
  }
  return section;
}

void ValidateNumber(const JsonValue& section, std::string_view section_name,
                    std::string_view key, double min_value, bool min_exclusive,
                    ValidationReport& report) {
  const JsonValue* field = section.Find(key);
  if (field == nullptr) {
    return;
  }
  const std::string path = std::string(section_name) + "." + std::string(key);
  if (!field->IsNumber() || !std::isfinite(field->number_value)) {
    AddIssue(report, path, "must be a finite number");
    return;
  }
  if (min_exclusive ? field->number_value <= min_value : field->number_value < min_value) {
    AddIssue(report, path,
             std::string("must be ") + (min_exclusive ? "> " : ">= ") +
                 std::to_string(static_cast<long long>(min_value)));
  }
}

void ValidateInteger(const JsonValue& section, std::string_view section_name,
                     std::string_view key, std::uint64_t min_value, std::uint64_t max_value,
                     ValidationReport& report) {
  const JsonValue* field = section.Find(key);
  if (field == nullptr) {
    return;
  }
  const std::string path = std::string(section_name) + "." + std::string(key);
  std::uint64_t parsed = 0;
  if (!core::json::TryGetCount(*field, parsed)) {
    AddIssue(report, path, "must be a non-negative integer");
    return;
  }
  if (parsed < min_value || parsed > max_value) {
    AddIssue(report, path,
             "must be in range [" + std::to_string(min_value) + "," + std::to_string(max_value) +
                 "]");
  }
}

void ValidateStringList(const JsonValue& section, std::string_view section_name,
                        std::string_view key, ValidationReport& report) {
  const JsonValue* field = section.Find(key);
  if (field == nullptr) {
    return;
  }
  const std::string path = std::string(section_name) + "." + std::string(key);
  if (!field->IsArray()) {
    AddIssue(report, path, "must be an array of strings");
    return;
  }
  for (std::size_t i = 0; i < field->array_value.size(); ++i) {
    const JsonValue& item = field->array_value[i];
    if (!item.IsString() || item.string_value.empty()) {
      AddIssue(report, path + "[" + std::to_string(i) + "]", "must be a non-empty string");
    }
  }
}

void ValidateString(const JsonValue& section, std::string_view section_name, std::string_view key,
                    bool allow_empty, ValidationReport& report) {
  const JsonValue* field = section.Find(key);
  if (field == nullptr) {
    return;
  }
  const std::string path = std::string(section_name) + "." + std::string(key);
  if (!field->IsString()) {
    AddIssue(report, path, "must be a string");
    return;
  }
  if (!allow_empty && field->string_value.empty()) {
    AddIssue(report, path, "must not be empty");
  }
}

void ValidateUpstream(const JsonValue& root, ValidationReport& report) {
  const JsonValue* upstream = root.Find("upstream");
  if (upstream == nullptr) {
    AddIssue(report, "upstream", "is required and must name a backend");
    return;
  }
  if (!upstream->IsObject()) {
    AddIssue(report, "upstream", "must be an object");
    return;
  }

  std::string backend = "replay";
  if (const JsonValue* field = upstream->Find("backend"); field != nullptr) {
    if (!field->IsString()) {
      AddIssue(report, "upstream.backend", "must be a string");
      return;
    }
    backend = field->string_value;
  }
  if (backend != "replay") {
    AddIssue(report, "upstream.backend", "must be one of: replay");
    return;
  }

  const JsonValue* replay_path = upstream->Find("replay_path");
  if (replay_path == nullptr) {
    AddIssue(report, "upstream.replay_path", "is required for backend 'replay'");
    return;
  }
  ValidateString(*upstream, "upstream", "replay_path", false, report);
}

void ValidateConfigRoot(const JsonValue& root, ValidationReport& report) {
  for (const auto& [key, value] : root.object_value) {
    (void)value;
    if (KnownSections().count(key) == 0U) {
      AddIssue(report, key, "is not a recognized config field");
    }
  }

  if (const JsonValue* instance_id = root.Find("instance_id"); instance_id != nullptr) {
    if (!instance_id->IsString() || instance_id->string_value.empty()) {
      AddIssue(report, "instance_id", "must be a non-empty string");
    }
  }

  ValidateUpstream(root, report);

  if (const JsonValue* section = Section(root, "search_criteria", report); section != nullptr) {
    ValidateNumber(*section, "search_criteria", "min_total_miles", 0.0, false, report);
    ValidateNumber(*section, "search_criteria", "max_deadhead_miles", 0.0, false, report);
    ValidateStringList(*section, "search_criteria", "excluded_regions", report);
  }

  if (const JsonValue* section = Section(root, "estimator", report); section != nullptr) {
    ValidateNumber(*section, "estimator", "base_rate_per_mile", 0.0, true, report);
    ValidateNumber(*section, "estimator", "min_rate_per_mile", 0.0, true, report);
    ValidateNumber(*section, "estimator", "mpg", 0.0, true, report);
    ValidateNumber(*section, "estimator", "fuel_price", 0.0, false, report);
    ValidateStringList(*section, "estimator", "preferred_equipment", report);
  }

  if (const JsonValue* section = Section(root, "dispatch", report); section != nullptr) {
    ValidateInteger(*section, "dispatch", "max_in_flight", 1U, 64U, report);
    ValidateNumber(*section, "dispatch", "shutdown_grace_s", 0.0, false, report);
  }

  if (const JsonValue* section = Section(root, "recovery", report); section != nullptr) {
    ValidateInteger(*section, "recovery", "max_attempts", 1U, 20U, report);
    ValidateNumber(*section, "recovery", "base_delay_s", 0.0, false, report);
    ValidateNumber(*section, "recovery", "cooldown_s", 0.0, false, report);
    ValidateNumber(*section, "recovery", "diagnostics_max_age_s", 0.0, false, report);
  }

  if (const JsonValue* section = Section(root, "scheduler", report); section != nullptr) {
    ValidateInteger(*section, "scheduler", "max_cycles", 0U,
                    std::numeric_limits<std::uint32_t>::max(), report);
    ValidateInteger(*section, "scheduler", "status_every_cycles", 1U, 100000U, report);
    ValidateNumber(*section, "scheduler", "alert_interval_s", 0.0, false, report);
  }

  if (const JsonValue* section = Section(root, "retention", report); section != nullptr) {
    ValidateInteger(*section, "retention", "days", 1U, 3650U, report);
    ValidateNumber(*section, "retention", "sweep_interval_s", 0.0, true, report);
  }

  if (const JsonValue* section = Section(root, "paths", report); section != nullptr) {
    ValidateString(*section, "paths", "state_dir", false, report);
    ValidateString(*section, "paths", "diagnostics_dir", true, report);
  }
}

} // namespace

bool ValidateConfigText(std::string_view json_text, ValidationReport& report, std::string& error) {
  (void)error;
  report = ValidationReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", "invalid JSON: " + parse_error);
    return true;
  }
  if (!root.IsObject()) {
    AddIssue(report, "$", "config root must be a JSON object");
    return true;
  }

  ValidateConfigRoot(root, report);
  report.valid = report.issues.empty();
  return true;
}

bool ValidateConfigFile(const std::filesystem::path& config_path, ValidationReport& report,
                        std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(config_path, contents, error)) {
    return false;
  }
  return ValidateConfigText(contents, report, error);
}

std::string FormatIssues(const ValidationReport& report) {
  std::string text;
  for (const ValidationIssue& issue : report.issues) {
    text += issue.path + ": " + issue.message + "\n";
  }
  return text;
}

} // namespace loadwatch::config
