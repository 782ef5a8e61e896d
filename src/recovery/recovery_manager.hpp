#pragma once

#include "core/clock.hpp"
#include "events/emitter.hpp"
#include "notify/alert_sink.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loadwatch::core {
class ShutdownSignal;
}

namespace loadwatch::core::logging {
class Logger;
}

namespace loadwatch::upstream {
class ISessionLifecycle;
}

namespace loadwatch::recovery {

enum class RecoveryState {
  kIdle,
  kStopping,
  kCleaning,
  kReinitializing,
  kReauthenticating,
  kSelfTesting,
  kEscalated,
};

const char* ToString(RecoveryState state);

enum class RecoveryOutcome {
  kRecovered,
  kEscalated,
  // Shutdown observed at a transition boundary or during backoff.
  kInterrupted,
};

const char* ToString(RecoveryOutcome outcome);

struct RecoveryConfig {
  std::uint32_t max_attempts = 3;
  double base_delay_s = 30.0;
  double cooldown_s = 300.0;
  double diagnostics_max_age_s = 3600.0;
  std::filesystem::path diagnostics_dir;
};

// Attempt bookkeeping. Attempts reset to zero after a fully successful run.
struct RecoverySession {
  std::uint32_t attempts = 0;
  std::optional<core::Clock::TimePoint> last_attempt_at;
  // Entry is refused before this point. Unset until the first attempt.
  std::optional<core::Clock::TimePoint> cooldown_deadline;
  RecoveryState state = RecoveryState::kIdle;
  // Backoff delays applied so far, in seconds, for the whole process.
  std::vector<double> backoff_history_s;
  std::uint64_t recoveries_succeeded = 0;
};

// base_delay * 2^attempts, where `attempts` counts failures so far.
double BackoffDelaySeconds(double base_delay_s, std::uint32_t attempts);

// Supervising state machine that rebuilds the upstream session when the
// controller declares the system unhealthy.
//
// IDLE -> STOPPING -> CLEANING -> REINITIALIZING -> REAUTHENTICATING ->
// SELF_TESTING -> IDLE, or ESCALATED once the attempt cap is reached. Retries
// are an explicit loop with an interruptible backoff wait; the cap is checked
// first in every attempt. ESCALATED is terminal for the process.
class RecoveryManager {
public:
  using StopHook = std::function<void()>;

  RecoveryManager(upstream::ISessionLifecycle& session, notify::IAlertSink& alerts,
                  events::Emitter& emitter, core::logging::Logger& logger, core::Clock& clock,
                  RecoveryConfig config);

  // Hooks run during STOPPING, before the session is torn down.
  void AddStopHook(StopHook hook);

  // True unless escalated or still inside the cooldown of the last attempt.
  bool CanEnter(core::Clock::TimePoint now) const;

  RecoveryOutcome Run(const core::ShutdownSignal& shutdown);

  const RecoverySession& session() const {
    return session_;
  }

  RecoveryState state() const {
    return session_.state;
  }

  bool escalated() const {
    return session_.state == RecoveryState::kEscalated;
  }

  const RecoveryConfig& config() const {
    return config_;
  }

private:
  enum class StepResult {
    kOk,
    kFailed,
    kInterrupted,
  };

  StepResult RunSequence(const core::ShutdownSignal& shutdown, std::string& failure);
  bool RunStep(RecoveryState state, std::string& error);
  void Escalate(std::string_view last_failure);
  void RaiseAlert(notify::AlertSeverity severity, std::string_view message);
  void EmitRecovery(events::Emitter::RecoveryEvent::Kind kind, std::string_view detail,
                    double backoff_s = 0.0);

  upstream::ISessionLifecycle& lifecycle_;
  notify::IAlertSink& alerts_;
  events::Emitter& emitter_;
  core::logging::Logger& logger_;
  core::Clock& clock_;
  RecoveryConfig config_;
  std::vector<StopHook> stop_hooks_;
  RecoverySession session_;
  std::string last_failure_;
};

} // namespace loadwatch::recovery
