#include "notify/alert_sink.hpp"

namespace loadwatch::notify {

const char* ToString(const AlertSeverity severity) {
  switch (severity) {
  case AlertSeverity::kInfo:
    return "info";
  case AlertSeverity::kWarning:
    return "warning";
  case AlertSeverity::kCritical:
    return "critical";
  case AlertSeverity::kFatal:
    return "fatal";
  }
  return "warning";
}

bool ParseAlertSeverity(std::string_view text, AlertSeverity& severity) {
  if (text == "info") {
    severity = AlertSeverity::kInfo;
    return true;
  }
  if (text == "warning") {
    severity = AlertSeverity::kWarning;
    return true;
  }
  if (text == "critical") {
    severity = AlertSeverity::kCritical;
    return true;
  }
  if (text == "fatal") {
    severity = AlertSeverity::kFatal;
    return true;
  }
  return false;
}

} // namespace loadwatch::notify
