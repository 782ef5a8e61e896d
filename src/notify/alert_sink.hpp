#pragma once

#include <string>
#include <string_view>

namespace loadwatch::notify {

enum class AlertSeverity {
  kInfo,
  kWarning,
  kCritical,
  kFatal,
};

const char* ToString(AlertSeverity severity);
bool ParseAlertSeverity(std::string_view text, AlertSeverity& severity);

// Operator-facing alert channel. Used for periodic degraded-health warnings,
// recovery outcomes, and the single terminal alert on escalation.
class IAlertSink {
public:
  virtual ~IAlertSink() = default;

  virtual bool RaiseAlert(AlertSeverity severity, std::string_view message,
                          std::string& error) = 0;
};

} // namespace loadwatch::notify
