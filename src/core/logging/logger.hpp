#pragma once

#include <atomic>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "core/string_utils.hpp"
#include "core/time_utils.hpp"

namespace loadwatch::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline constexpr std::string_view kLogLevelChoices = "debug|info|warn|error";

// Accepts the --log-level / config spellings, case-insensitive. "warning" is
// an alias for warn.
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  if (raw.empty()) {
    error = "missing value for --log-level (expected " + std::string(kLogLevelChoices) + ")";
    return false;
  }

  const std::string lowered = ToLowerAscii(raw);

  struct Spelling {
    std::string_view name;
    LogLevel level;
  };
  static constexpr Spelling kSpellings[] = {
      {"debug", LogLevel::kDebug},
      {"info", LogLevel::kInfo},
      {"warn", LogLevel::kWarn},
      {"warning", LogLevel::kWarn},
      {"error", LogLevel::kError},
  };
  for (const auto& spelling : kSpellings) {
    if (lowered == spelling.name) {
      level = spelling.level;
      return true;
    }
  }

  error = "invalid --log-level '" + std::string(raw) + "' (expected " +
          std::string(kLogLevelChoices) + ")";
  return false;
}

// Structured key=value logger shared by the scheduler, pipeline workers and
// recovery manager. One line per call; lines from concurrent dispatch workers
// never interleave.
//
//   ts_utc=2024-05-01T12:00:00.000Z level=INFO instance="east-1" msg="..." k="v"
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Call before the logger is shared with worker threads.
  void SetInstanceId(std::string instance_id) {
    instance_id_ = std::move(instance_id);
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_.load());
  }

  void Log(LogLevel level,
           std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    std::string line;
    line.reserve(96 + message.size() + fields.size() * 24);
    line += "ts_utc=";
    line += FormatUtcTimestamp(std::chrono::system_clock::now());
    line += " level=";
    line += ToString(level);
    line += " instance=";
    AppendQuoted(line, instance_id_);
    line += " msg=";
    AppendQuoted(line, message);
    for (const auto& field : fields) {
      line += ' ';
      line += field.key;
      line += '=';
      AppendQuoted(line, field.value);
    }
    line += '\n';

    std::lock_guard<std::mutex> lock(mu_);
    (*out_) << line;
    out_->flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  // Scraped load text can carry quotes and line breaks; a log line must stay
  // one line.
  static void AppendQuoted(std::string& out, std::string_view raw) {
    out += '"';
    for (const char c : raw) {
      switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
        break;
      }
    }
    out += '"';
  }

  std::atomic<LogLevel> min_level_;
  std::ostream* out_;
  std::string instance_id_ = "-";
  std::mutex mu_;
};

} // namespace loadwatch::core::logging
