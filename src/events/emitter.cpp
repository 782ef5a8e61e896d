#include "events/emitter.hpp"

#include "core/json_utils.hpp"
#include "events/jsonl_writer.hpp"

#include <utility>

namespace loadwatch::events {

namespace {

const char* BoolText(const bool value) {
  return value ? "true" : "false";
}

EventType ToEventType(const Emitter::RecoveryEvent::Kind kind) {
  switch (kind) {
  case Emitter::RecoveryEvent::Kind::kStarted:
    return EventType::kRecoveryStarted;
  case Emitter::RecoveryEvent::Kind::kStep:
    return EventType::kRecoveryStep;
  case Emitter::RecoveryEvent::Kind::kSucceeded:
    return EventType::kRecoverySucceeded;
  case Emitter::RecoveryEvent::Kind::kFailed:
    return EventType::kRecoveryFailed;
  case Emitter::RecoveryEvent::Kind::kEscalated:
  default:
    return EventType::kRecoveryEscalated;
  }
}

} // namespace

Emitter::Emitter(std::filesystem::path events_path) : events_path_(std::move(events_path)) {}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) {
  if (!enabled()) {
    return true;
  }
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);

  std::lock_guard<std::mutex> lock(mu_);
  return AppendEventJsonl(event, events_path_, error);
}

bool Emitter::EmitSchedulerLifecycle(const SchedulerLifecycleEvent& event, std::string& error) {
  std::map<std::string, std::string> payload = {
      {"cycles", std::to_string(event.cycles)},
  };
  if (!event.reason.empty()) {
    payload["reason"] = event.reason;
  }
  return EmitRaw(event.started ? EventType::kSchedulerStarted : EventType::kSchedulerStopped,
                 event.ts, std::move(payload), error);
}

bool Emitter::EmitScanFailed(const ScanFailedEvent& event, std::string& error) {
  return EmitRaw(EventType::kScanFailed, event.ts,
                 {
                     {"cycle", std::to_string(event.cycle)},
                     {"error_code", event.error_code},
                     {"error", event.error},
                     {"response_time_s", core::FormatJsonNumber(event.response_time_s)},
                 },
                 error);
}

bool Emitter::EmitStrategyChanged(const StrategyChangedEvent& event, std::string& error) {
  return EmitRaw(EventType::kStrategyChanged, event.ts,
                 {
                     {"cycle", std::to_string(event.cycle)},
                     {"interval_s", core::FormatJsonNumber(event.interval_s, 1)},
                     {"concurrent_requests", std::to_string(event.concurrent_requests)},
                     {"timeout_s", core::FormatJsonNumber(event.timeout_s, 1)},
                     {"diagnostics_on_error", BoolText(event.diagnostics_on_error)},
                     {"max_retries", std::to_string(event.max_retries)},
                     {"fast_path_transport", BoolText(event.fast_path_transport)},
                 },
                 error);
}

bool Emitter::EmitHealthLevelChanged(const HealthLevelChangedEvent& event, std::string& error) {
  return EmitRaw(EventType::kHealthLevelChanged, event.ts,
                 {
                     {"cycle", std::to_string(event.cycle)},
                     {"from", event.from_level},
                     {"to", event.to_level},
                     {"success_rate", core::FormatJsonNumber(event.success_rate)},
                     {"avg_response_time_s", core::FormatJsonNumber(event.avg_response_time_s)},
                     {"error_count", core::FormatJsonNumber(event.error_count, 1)},
                 },
                 error);
}

bool Emitter::EmitDispatchOutcome(const DispatchOutcomeEvent& event, std::string& error) {
  std::map<std::string, std::string> payload = {
      {"external_id", event.external_id},
      {"fingerprint", event.fingerprint},
  };
  if (event.dispatched) {
    payload["priority"] = event.priority;
    payload["rate_per_mile"] = core::FormatJsonNumber(event.rate_per_mile, 2);
    payload["persisted"] = BoolText(event.persisted);
    return EmitRaw(EventType::kLoadDispatched, event.ts, std::move(payload), error);
  }
  payload["stage"] = event.stage;
  payload["error"] = event.error;
  return EmitRaw(EventType::kDispatchFailed, event.ts, std::move(payload), error);
}

bool Emitter::EmitRecovery(const RecoveryEvent& event, std::string& error) {
  std::map<std::string, std::string> payload = {
      {"attempt", std::to_string(event.attempt)},
      {"state", event.state},
  };
  if (!event.detail.empty()) {
    payload["detail"] = event.detail;
  }
  if (event.kind == RecoveryEvent::Kind::kFailed) {
    payload["backoff_s"] = core::FormatJsonNumber(event.backoff_s, 1);
  }
  return EmitRaw(ToEventType(event.kind), event.ts, std::move(payload), error);
}

bool Emitter::EmitAlert(const AlertEvent& event, std::string& error) {
  return EmitRaw(EventType::kAlert, event.ts,
                 {
                     {"severity", event.severity},
                     {"message", event.message},
                 },
                 error);
}

} // namespace loadwatch::events
