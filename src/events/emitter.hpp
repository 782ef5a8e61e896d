#pragma once

#include "events/event_model.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace loadwatch::events {

// Typed facade over the JSONL timeline so every producer writes the same
// payload keys for the same event type.
//
// Safe to share between the scheduler thread and dispatch workers. An emitter
// built with an empty path is disabled: every Emit call succeeds without I/O.
class Emitter {
public:
  struct SchedulerLifecycleEvent {
    std::chrono::system_clock::time_point ts{};
    bool started = true;
    std::string reason;
    std::uint64_t cycles = 0;
  };

  struct ScanFailedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t cycle = 0;
    std::string error_code;
    std::string error;
    double response_time_s = 0.0;
  };

  struct StrategyChangedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t cycle = 0;
    double interval_s = 0.0;
    std::uint32_t concurrent_requests = 0;
    double timeout_s = 0.0;
    bool diagnostics_on_error = false;
    std::uint32_t max_retries = 0;
    bool fast_path_transport = false;
  };

  struct HealthLevelChangedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t cycle = 0;
    std::string from_level;
    std::string to_level;
    double success_rate = 0.0;
    double avg_response_time_s = 0.0;
    double error_count = 0.0;
  };

  struct DispatchOutcomeEvent {
    std::chrono::system_clock::time_point ts{};
    bool dispatched = true;
    std::string external_id;
    std::string fingerprint;
    std::string priority;
    double rate_per_mile = 0.0;
    // kDispatchFailed only: which collaborator call failed.
    std::string stage;
    std::string error;
    bool persisted = false;
  };

  struct RecoveryEvent {
    enum class Kind {
      kStarted,
      kStep,
      kSucceeded,
      kFailed,
      kEscalated,
    };

    Kind kind = Kind::kStarted;
    std::chrono::system_clock::time_point ts{};
    std::uint32_t attempt = 0;
    std::string state;
    std::string detail;
    double backoff_s = 0.0;
  };

  struct AlertEvent {
    std::chrono::system_clock::time_point ts{};
    std::string severity;
    std::string message;
  };

  explicit Emitter(std::filesystem::path events_path);

  Emitter(const Emitter&) = delete;
  Emitter& operator=(const Emitter&) = delete;

  bool enabled() const {
    return !events_path_.empty();
  }

  const std::filesystem::path& events_path() const {
    return events_path_;
  }

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error);

  bool EmitSchedulerLifecycle(const SchedulerLifecycleEvent& event, std::string& error);
  bool EmitScanFailed(const ScanFailedEvent& event, std::string& error);
  bool EmitStrategyChanged(const StrategyChangedEvent& event, std::string& error);
  bool EmitHealthLevelChanged(const HealthLevelChangedEvent& event, std::string& error);
  bool EmitDispatchOutcome(const DispatchOutcomeEvent& event, std::string& error);
  bool EmitRecovery(const RecoveryEvent& event, std::string& error);
  bool EmitAlert(const AlertEvent& event, std::string& error);

private:
  std::filesystem::path events_path_;
  std::mutex mu_;
};

} // namespace loadwatch::events
