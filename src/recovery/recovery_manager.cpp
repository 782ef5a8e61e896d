#include "recovery/recovery_manager.hpp"

#include "core/errors/failure_class.hpp"
#include "core/logging/logger.hpp"
#include "core/shutdown_signal.hpp"
#include "core/time_utils.hpp"
#include "recovery/diagnostics_cleanup.hpp"
#include "upstream/error_mapper.hpp"
#include "upstream/upstream.hpp"

#include <cmath>
#include <exception>
#include <utility>

namespace loadwatch::recovery {

namespace {

constexpr RecoveryState kSequence[] = {
    RecoveryState::kStopping,
    RecoveryState::kCleaning,
    RecoveryState::kReinitializing,
    RecoveryState::kReauthenticating,
    RecoveryState::kSelfTesting,
};

const char* StepOperation(const RecoveryState state) {
  switch (state) {
  case RecoveryState::kStopping:
    return "teardown";
  case RecoveryState::kCleaning:
    return "cleanup";
  case RecoveryState::kReinitializing:
    return "rebuild";
  case RecoveryState::kReauthenticating:
    return "authenticate";
  case RecoveryState::kSelfTesting:
    return "probe";
  default:
    return "recovery";
  }
}

} // namespace

const char* ToString(const RecoveryState state) {
  switch (state) {
  case RecoveryState::kIdle:
    return "IDLE";
  case RecoveryState::kStopping:
    return "STOPPING";
  case RecoveryState::kCleaning:
    return "CLEANING";
  case RecoveryState::kReinitializing:
    return "REINITIALIZING";
  case RecoveryState::kReauthenticating:
    return "REAUTHENTICATING";
  case RecoveryState::kSelfTesting:
    return "SELF_TESTING";
  case RecoveryState::kEscalated:
    return "ESCALATED";
  }
  return "IDLE";
}

const char* ToString(const RecoveryOutcome outcome) {
  switch (outcome) {
  case RecoveryOutcome::kRecovered:
    return "recovered";
  case RecoveryOutcome::kEscalated:
    return "escalated";
  case RecoveryOutcome::kInterrupted:
    return "interrupted";
  }
  return "interrupted";
}

double BackoffDelaySeconds(const double base_delay_s, const std::uint32_t attempts) {
  return base_delay_s * std::pow(2.0, static_cast<double>(attempts));
}

RecoveryManager::RecoveryManager(upstream::ISessionLifecycle& session, notify::IAlertSink& alerts,
                                 events::Emitter& emitter, core::logging::Logger& logger,
                                 core::Clock& clock, RecoveryConfig config)
    : lifecycle_(session), alerts_(alerts), emitter_(emitter), logger_(logger), clock_(clock),
      config_(std::move(config)) {}

void RecoveryManager::AddStopHook(StopHook hook) {
  if (hook) {
    stop_hooks_.push_back(std::move(hook));
  }
}

bool RecoveryManager::CanEnter(const core::Clock::TimePoint now) const {
  if (escalated()) {
    return false;
  }
  return !session_.cooldown_deadline.has_value() || now >= *session_.cooldown_deadline;
}

RecoveryOutcome RecoveryManager::Run(const core::ShutdownSignal& shutdown) {
  using Kind = events::Emitter::RecoveryEvent::Kind;

  if (escalated()) {
    return RecoveryOutcome::kEscalated;
  }

  while (true) {
    if (shutdown.StopRequested()) {
      session_.state = RecoveryState::kIdle;
      logger_.Info("recovery interrupted by shutdown");
      return RecoveryOutcome::kInterrupted;
    }

    // Cap first: an attempt never starts once the budget is spent.
    if (session_.attempts >= config_.max_attempts) {
      Escalate(last_failure_);
      return RecoveryOutcome::kEscalated;
    }

    const core::Clock::TimePoint started = clock_.Now();
    session_.last_attempt_at = started;
    session_.cooldown_deadline = started + core::SecondsToDuration(config_.cooldown_s);
    logger_.Warn("recovery attempt started",
                 {{"attempt", std::to_string(session_.attempts + 1U)},
                  {"max_attempts", std::to_string(config_.max_attempts)}});
    EmitRecovery(Kind::kStarted, "");

    std::string failure;
    const StepResult result = RunSequence(shutdown, failure);
    if (result == StepResult::kInterrupted) {
      session_.state = RecoveryState::kIdle;
      logger_.Info("recovery interrupted by shutdown");
      return RecoveryOutcome::kInterrupted;
    }

    if (result == StepResult::kOk) {
      session_.state = RecoveryState::kIdle;
      EmitRecovery(Kind::kSucceeded, "");
      session_.attempts = 0;
      ++session_.recoveries_succeeded;
      last_failure_.clear();
      logger_.Info("recovery succeeded",
                   {{"recoveries", std::to_string(session_.recoveries_succeeded)}});
      RaiseAlert(notify::AlertSeverity::kInfo, "System recovered and scanning resumed");
      return RecoveryOutcome::kRecovered;
    }

    ++session_.attempts;
    last_failure_ = failure;
    const double delay_s = BackoffDelaySeconds(config_.base_delay_s, session_.attempts);
    session_.backoff_history_s.push_back(delay_s);
    session_.state = RecoveryState::kIdle;
    logger_.Error("recovery attempt failed",
                  {{"attempt", std::to_string(session_.attempts)},
                   {"error", failure},
                   {"backoff_s", core::FormatSeconds(std::chrono::duration<double>(delay_s))}});
    EmitRecovery(Kind::kFailed, failure, delay_s);
    RaiseAlert(notify::AlertSeverity::kCritical,
               "Recovery attempt " + std::to_string(session_.attempts) + " of " +
                   std::to_string(config_.max_attempts) + " failed: " + failure);

    if (!clock_.SleepFor(core::SecondsToDuration(delay_s), shutdown)) {
      session_.state = RecoveryState::kIdle;
      logger_.Info("recovery backoff interrupted by shutdown");
      return RecoveryOutcome::kInterrupted;
    }
  }
}

RecoveryManager::StepResult RecoveryManager::RunSequence(const core::ShutdownSignal& shutdown,
                                                         std::string& failure) {
  using Kind = events::Emitter::RecoveryEvent::Kind;

  for (const RecoveryState step : kSequence) {
    if (shutdown.StopRequested()) {
      return StepResult::kInterrupted;
    }
    session_.state = step;
    logger_.Info("recovery step", {{"state", ToString(step)}});
    EmitRecovery(Kind::kStep, "");

    std::string error;
    bool ok = false;
    try {
      ok = RunStep(step, error);
    } catch (const std::exception& ex) {
      error = std::string("step threw: ") + ex.what();
    }
    if (!ok) {
      failure = std::string(ToString(step)) + ": " +
                (step == RecoveryState::kCleaning ? error
                                                  : upstream::FormatUpstreamError(
                                                        StepOperation(step), error));
      return StepResult::kFailed;
    }
  }
  return StepResult::kOk;
}

bool RecoveryManager::RunStep(const RecoveryState state, std::string& error) {
  switch (state) {
  case RecoveryState::kStopping:
    for (const StopHook& hook : stop_hooks_) {
      hook();
    }
    return lifecycle_.Teardown(error);
  case RecoveryState::kCleaning: {
    std::uint64_t removed = 0;
    const auto max_age = std::chrono::seconds(
        static_cast<std::int64_t>(config_.diagnostics_max_age_s));
    if (!CleanupStaleDiagnostics(config_.diagnostics_dir, max_age, removed, error)) {
      return false;
    }
    if (removed > 0U) {
      logger_.Info("removed stale diagnostics", {{"count", std::to_string(removed)}});
    }
    return true;
  }
  case RecoveryState::kReinitializing:
    return lifecycle_.Rebuild(error);
  case RecoveryState::kReauthenticating:
    return lifecycle_.Authenticate(error);
  case RecoveryState::kSelfTesting:
    return lifecycle_.Probe(error);
  case RecoveryState::kIdle:
  case RecoveryState::kEscalated:
    break;
  }
  error = std::string("no action for recovery state ") + ToString(state);
  return false;
}

void RecoveryManager::Escalate(std::string_view last_failure) {
  session_.state = RecoveryState::kEscalated;
  logger_.Error("recovery escalated; scanning halted until operator restart",
                {{"class", core::errors::ToStableCode(core::errors::FailureClass::kRecoveryExhausted)},
                 {"attempts", std::to_string(session_.attempts)},
                 {"last_failure", last_failure}});
  EmitRecovery(events::Emitter::RecoveryEvent::Kind::kEscalated, last_failure);
  std::string message = "Recovery exhausted after " + std::to_string(session_.attempts) +
                        " attempts; manual restart required";
  if (!last_failure.empty()) {
    message += ". Last failure: " + std::string(last_failure);
  }
  RaiseAlert(notify::AlertSeverity::kFatal, message);
}

void RecoveryManager::RaiseAlert(const notify::AlertSeverity severity, std::string_view message) {
  std::string error;
  if (!alerts_.RaiseAlert(severity, message, error)) {
    logger_.Warn("failed to raise alert", {{"severity", notify::ToString(severity)},
                                           {"error", error}});
  }
}

void RecoveryManager::EmitRecovery(const events::Emitter::RecoveryEvent::Kind kind,
                                   std::string_view detail, const double backoff_s) {
  using Kind = events::Emitter::RecoveryEvent::Kind;

  // Failed and escalated events report attempts already counted; the others
  // report the attempt in progress.
  const bool counted = kind == Kind::kFailed || kind == Kind::kEscalated;
  std::string error;
  const bool emitted = emitter_.EmitRecovery(
      events::Emitter::RecoveryEvent{
          .kind = kind,
          .ts = clock_.WallNow(),
          .attempt = counted ? session_.attempts : session_.attempts + 1U,
          .state = ToString(session_.state),
          .detail = std::string(detail),
          .backoff_s = backoff_s,
      },
      error);
  if (!emitted) {
    logger_.Warn("failed to append recovery event", {{"error", error}});
  }
}

} // namespace loadwatch::recovery
