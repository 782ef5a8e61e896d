#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace loadwatch::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kSchedulerStarted:
    return "SCHEDULER_STARTED";
  case EventType::kSchedulerStopped:
    return "SCHEDULER_STOPPED";
  case EventType::kScanFailed:
    return "SCAN_FAILED";
  case EventType::kStrategyChanged:
    return "STRATEGY_CHANGED";
  case EventType::kHealthLevelChanged:
    return "HEALTH_LEVEL_CHANGED";
  case EventType::kLoadDispatched:
    return "LOAD_DISPATCHED";
  case EventType::kDispatchFailed:
    return "DISPATCH_FAILED";
  case EventType::kRecoveryStarted:
    return "RECOVERY_STARTED";
  case EventType::kRecoveryStep:
    return "RECOVERY_STEP";
  case EventType::kRecoverySucceeded:
    return "RECOVERY_SUCCEEDED";
  case EventType::kRecoveryFailed:
    return "RECOVERY_FAILED";
  case EventType::kRecoveryEscalated:
    return "RECOVERY_ESCALATED";
  case EventType::kRetentionSweep:
    return "RETENTION_SWEEP";
  case EventType::kAlert:
    return "ALERT";
  case EventType::kInfo:
    return "info";
  case EventType::kWarning:
    return "warning";
  case EventType::kError:
    return "error";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{"
      << "\"ts_utc\":\"" << core::FormatUtcTimestamp(event.ts) << "\","
      << "\"type\":\"" << ToJson(event.type) << "\","
      << "\"payload\":{";

  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << core::QuoteJson(key) << ':' << core::QuoteJson(value);
    first = false;
  }

  out << "}}";
  return out.str();
}

} // namespace loadwatch::events
