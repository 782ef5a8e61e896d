#pragma once

#include <chrono>
#include <map>
#include <string>

namespace loadwatch::events {

// Timeline event categories. Downstream tooling greps on the serialized names,
// so existing values must keep their spelling.
enum class EventType {
  kSchedulerStarted,
  kSchedulerStopped,
  kScanFailed,
  kStrategyChanged,
  kHealthLevelChanged,
  kLoadDispatched,
  kDispatchFailed,
  kRecoveryStarted,
  kRecoveryStep,
  kRecoverySucceeded,
  kRecoveryFailed,
  kRecoveryEscalated,
  kRetentionSweep,
  kAlert,
  kInfo,
  kWarning,
  kError,
};

// One timeline entry.
//
// - `ts`: UTC timestamp when the event occurred.
// - `type`: normalized category.
// - `payload`: string key/value attributes; std::map keeps key order stable so
//   lines diff cleanly.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kInfo;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace loadwatch::events
