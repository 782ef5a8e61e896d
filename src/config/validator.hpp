#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace loadwatch::config {

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Validates config JSON text.
//
// Contract:
// - Returns true when validation completed (even if the config is invalid).
// - Returns false only for failures outside the validation flow.
// - Populates `report.valid` and `report.issues`.
// - On parse errors, emits one issue under path `$`.
bool ValidateConfigText(std::string_view json_text, ValidationReport& report, std::string& error);

// Loads and validates a config file. Returns false only if file I/O fails.
bool ValidateConfigFile(const std::filesystem::path& config_path, ValidationReport& report,
                        std::string& error);

// One issue per line: "<path>: <message>".
std::string FormatIssues(const ValidationReport& report);

} // namespace loadwatch::config
