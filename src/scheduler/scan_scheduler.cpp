#include "scheduler/scan_scheduler.hpp"

#include "core/errors/failure_class.hpp"
#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/shutdown_signal.hpp"
#include "core/time_utils.hpp"
#include "dispatch/sent_store.hpp"
#include "events/emitter.hpp"
#include "recovery/recovery_manager.hpp"
#include "scheduler/status_writer.hpp"
#include "upstream/error_mapper.hpp"
#include "upstream/upstream.hpp"

#include <chrono>
#include <exception>
#include <utility>

namespace loadwatch::scheduler {

namespace {

bool IsUnhealthy(const adaptive::AdaptationLevel level) {
  return level == adaptive::AdaptationLevel::kDegraded ||
         level == adaptive::AdaptationLevel::kCritical;
}

double ToSeconds(const core::Clock::Duration duration) {
  return std::chrono::duration<double>(duration).count();
}

} // namespace

const char* ToString(const SchedulerExit exit) {
  switch (exit) {
  case SchedulerExit::kShutdown:
    return "shutdown";
  case SchedulerExit::kMaxCycles:
    return "max_cycles";
  case SchedulerExit::kEscalated:
    return "escalated";
  }
  return "shutdown";
}

ScanScheduler::ScanScheduler(upstream::IUpstream& upstream, dispatch::DispatchPipeline& pipeline,
                             adaptive::Controller& controller,
                             recovery::RecoveryManager& recovery, dispatch::ISentStore& store,
                             notify::IAlertSink& alerts, events::Emitter& emitter,
                             core::logging::Logger& logger, core::Clock& clock,
                             const core::ShutdownSignal& shutdown, SchedulerOptions options)
    : upstream_(upstream), pipeline_(pipeline), controller_(controller), recovery_(recovery),
      store_(store), alerts_(alerts), emitter_(emitter), logger_(logger), clock_(clock),
      shutdown_(shutdown), options_(std::move(options)) {
  // Recovery runs between ticks, so dispatch has already drained when the
  // stop hooks fire. Publishing here lets an operator see the pause before the
  // session teardown, which can block for a while.
  recovery_.AddStopHook([this]() {
    logger_.Info("scan loop paused for recovery");
    WriteStatus("recovering");
  });
}

SchedulerResult ScanScheduler::Run() {
  started_ = clock_.Now();
  stats_ = MonitoringStats{};
  stats_.started_at = clock_.WallNow();
  level_ = controller_.Level();
  adaptive::ScanStrategy strategy = controller_.DeriveStrategy();

  logger_.Info("scan loop started",
               {{"interval_s", core::FormatJsonNumber(strategy.interval_s, 1)},
                {"max_cycles", std::to_string(options_.max_cycles)}});
  std::string emit_error;
  if (!emitter_.EmitSchedulerLifecycle(
          events::Emitter::SchedulerLifecycleEvent{.ts = stats_.started_at, .started = true},
          emit_error)) {
    logger_.Warn("failed to append scheduler event", {{"error", emit_error}});
  }

  SchedulerResult result;
  std::uint64_t cycle = 0;
  while (true) {
    if (shutdown_.StopRequested()) {
      result.exit = SchedulerExit::kShutdown;
      break;
    }
    if (recovery_.escalated()) {
      result.exit = SchedulerExit::kEscalated;
      break;
    }
    if (options_.max_cycles > 0U && cycle >= options_.max_cycles) {
      result.exit = SchedulerExit::kMaxCycles;
      break;
    }

    ++cycle;
    const core::Clock::TimePoint tick_start = clock_.Now();
    if (const std::optional<SchedulerExit> exit = RunTick(cycle, strategy); exit.has_value()) {
      result.exit = *exit;
      break;
    }

    if (options_.status_every_cycles > 0U && cycle % options_.status_every_cycles == 0U) {
      WriteStatus("running");
    }

    const core::Clock::Duration elapsed = clock_.Now() - tick_start;
    const core::Clock::Duration interval = core::SecondsToDuration(strategy.interval_s);
    if (elapsed < interval) {
      // An interrupted sleep is picked up by the shutdown check at the top.
      (void)clock_.SleepFor(interval - elapsed, shutdown_);
    }
  }

  result.cycles = cycle;
  WriteStatus(result.exit == SchedulerExit::kEscalated ? "escalated" : "stopped");
  result.stats = stats_;

  logger_.Info("scan loop stopped", {{"reason", ToString(result.exit)},
                                     {"cycles", std::to_string(cycle)},
                                     {"loads_sent_total",
                                      std::to_string(stats_.loads_sent_total)}});
  if (!emitter_.EmitSchedulerLifecycle(
          events::Emitter::SchedulerLifecycleEvent{
              .ts = clock_.WallNow(),
              .started = false,
              .reason = ToString(result.exit),
              .cycles = cycle,
          },
          emit_error)) {
    logger_.Warn("failed to append scheduler event", {{"error", emit_error}});
  }
  return result;
}

std::optional<SchedulerExit> ScanScheduler::RunTick(const std::uint64_t cycle,
                                                    adaptive::ScanStrategy& strategy) {
  const core::Clock::TimePoint fetch_start = clock_.Now();
  loads::LoadBatch batch;
  std::string fetch_error;
  bool fetched = false;
  try {
    fetched = upstream_.FetchBatch(strategy, batch, fetch_error);
  } catch (const std::exception& ex) {
    fetch_error = std::string("upstream threw: ") + ex.what();
  }
  const double response_time_s = ToSeconds(clock_.Now() - fetch_start);

  ++stats_.scan_count;
  if (timing_.Track(response_time_s * 1000.0)) {
    logger_.Warn("slow scan", {{"cycle", std::to_string(cycle)},
                               {"response_time_s", core::FormatJsonNumber(response_time_s)}});
  }

  std::uint32_t loads_found = 0;
  if (fetched) {
    loads_found = static_cast<std::uint32_t>(batch.size());
    stats_.loads_found_total += loads_found;

    const dispatch::DispatchSummary summary = pipeline_.ProcessBatch(batch, options_.criteria);
    stats_.last_dispatch = summary;
    stats_.loads_sent_total += summary.sent;
    stats_.dispatch_failures += summary.failed;
    stats_.persist_failures += summary.persist_failures;
    stats_.abandoned_total += summary.abandoned;
    logger_.Debug("scan complete", {{"cycle", std::to_string(cycle)},
                                    {"found", std::to_string(loads_found)},
                                    {"attempted", std::to_string(summary.attempted)},
                                    {"sent", std::to_string(summary.sent)}});
  } else {
    ++stats_.failed_scans;
    const upstream::UpstreamErrorMapping mapped = upstream::MapUpstreamError("fetch", fetch_error);
    logger_.Warn("scan failed", {{"class", core::errors::ToStableCode(
                                              core::errors::FailureClass::kTransientUpstream)},
                                 {"cycle", std::to_string(cycle)},
                                 {"code", upstream::ToStableErrorCode(mapped.code)},
                                 {"error", mapped.detail}});
    std::string emit_error;
    if (!emitter_.EmitScanFailed(
            events::Emitter::ScanFailedEvent{
                .ts = clock_.WallNow(),
                .cycle = cycle,
                .error_code = std::string(upstream::ToStableErrorCode(mapped.code)),
                .error = mapped.detail,
                .response_time_s = response_time_s,
            },
            emit_error)) {
      logger_.Warn("failed to append scan event", {{"error", emit_error}});
    }
  }

  controller_.UpdateMetrics(response_time_s, loads_found, fetched ? 0.0 : 1.0, fetched);
  ObserveAdaptation(cycle, strategy);
  MaybeRaiseDegradedAlert();

  if (controller_.ShouldTriggerRecovery()) {
    if (!recovery_.CanEnter(clock_.Now())) {
      logger_.Debug("recovery wanted but cooling down", {{"cycle", std::to_string(cycle)}});
    } else {
      ++stats_.recoveries_started;
      logger_.Warn("health critical; entering recovery",
                   {{"class", core::errors::ToStableCode(core::errors::FailureClass::kHealthCritical)},
                    {"cycle", std::to_string(cycle)},
                    {"level", adaptive::ToString(controller_.Level())}});
      const recovery::RecoveryOutcome outcome = recovery_.Run(shutdown_);
      switch (outcome) {
      case recovery::RecoveryOutcome::kRecovered:
        ++stats_.recoveries_succeeded;
        strategy = controller_.DeriveStrategy();
        logger_.Info("scan loop resumed after recovery",
                     {{"interval_s", core::FormatJsonNumber(strategy.interval_s, 1)}});
        break;
      case recovery::RecoveryOutcome::kEscalated:
        return SchedulerExit::kEscalated;
      case recovery::RecoveryOutcome::kInterrupted:
        return SchedulerExit::kShutdown;
      }
    }
  }

  MaybeSweepRetention();
  return std::nullopt;
}

void ScanScheduler::ObserveAdaptation(const std::uint64_t cycle,
                                      adaptive::ScanStrategy& strategy) {
  const adaptive::ScanStrategy next = controller_.DeriveStrategy();
  const adaptive::HealthMetrics& metrics = controller_.metrics();
  std::string emit_error;

  if (!(next == strategy)) {
    logger_.Info("scan strategy changed",
                 {{"interval_s", core::FormatJsonNumber(next.interval_s, 1)},
                  {"concurrent_requests", std::to_string(next.concurrent_requests)},
                  {"timeout_s", core::FormatJsonNumber(next.timeout_s, 1)}});
    if (!emitter_.EmitStrategyChanged(
            events::Emitter::StrategyChangedEvent{
                .ts = clock_.WallNow(),
                .cycle = cycle,
                .interval_s = next.interval_s,
                .concurrent_requests = next.concurrent_requests,
                .timeout_s = next.timeout_s,
                .diagnostics_on_error = next.diagnostics_on_error,
                .max_retries = next.max_retries,
                .fast_path_transport = next.fast_path_transport,
            },
            emit_error)) {
      logger_.Warn("failed to append strategy event", {{"error", emit_error}});
    }
    strategy = next;
  }

  const adaptive::AdaptationLevel level = controller_.Level();
  if (level != level_) {
    logger_.Info("adaptation level changed", {{"from", adaptive::ToString(level_)},
                                              {"to", adaptive::ToString(level)}});
    if (!emitter_.EmitHealthLevelChanged(
            events::Emitter::HealthLevelChangedEvent{
                .ts = clock_.WallNow(),
                .cycle = cycle,
                .from_level = adaptive::ToString(level_),
                .to_level = adaptive::ToString(level),
                .success_rate = metrics.success_rate,
                .avg_response_time_s = metrics.avg_response_time_s,
                .error_count = metrics.error_count,
            },
            emit_error)) {
      logger_.Warn("failed to append level event", {{"error", emit_error}});
    }
    if (IsUnhealthy(level_) && !IsUnhealthy(level)) {
      RaiseAlert(notify::AlertSeverity::kInfo,
                 std::string("Scan health restored to ") + adaptive::ToString(level));
      last_degraded_alert_.reset();
    }
    level_ = level;
  }
}

void ScanScheduler::MaybeRaiseDegradedAlert() {
  if (!IsUnhealthy(level_)) {
    return;
  }
  const core::Clock::TimePoint now = clock_.Now();
  if (last_degraded_alert_.has_value() &&
      now - *last_degraded_alert_ < core::SecondsToDuration(options_.alert_interval_s)) {
    return;
  }
  last_degraded_alert_ = now;

  const adaptive::HealthMetrics& metrics = controller_.metrics();
  RaiseAlert(level_ == adaptive::AdaptationLevel::kCritical ? notify::AlertSeverity::kCritical
                                                            : notify::AlertSeverity::kWarning,
             std::string("Scan health ") + adaptive::ToString(level_) +
                 ": success_rate=" + core::FormatJsonNumber(metrics.success_rate, 2) +
                 " avg_response_s=" + core::FormatJsonNumber(metrics.avg_response_time_s, 2) +
                 " errors=" + core::FormatJsonNumber(metrics.error_count, 1));
}

void ScanScheduler::MaybeSweepRetention() {
  const core::Clock::TimePoint now = clock_.Now();
  if (last_retention_sweep_.has_value() &&
      now - *last_retention_sweep_ <
          core::SecondsToDuration(options_.retention_sweep_interval_s)) {
    return;
  }
  last_retention_sweep_ = now;

  const auto cutoff =
      clock_.WallNow() - std::chrono::hours(24) * static_cast<int>(options_.retention_days);
  std::uint64_t removed = 0;
  std::string error;
  if (!store_.PurgeOlderThan(cutoff, removed, error)) {
    logger_.Warn("retention sweep failed", {{"error", error}});
    return;
  }
  stats_.retention_removed_total += removed;
  if (removed == 0U) {
    return;
  }
  logger_.Info("retention sweep removed sent records",
               {{"removed", std::to_string(removed)},
                {"cutoff_utc", core::FormatUtcTimestamp(cutoff)}});
  std::string emit_error;
  if (!emitter_.EmitRaw(events::EventType::kRetentionSweep, clock_.WallNow(),
                        {{"removed", std::to_string(removed)},
                         {"cutoff_utc", core::FormatUtcTimestamp(cutoff)}},
                        emit_error)) {
    logger_.Warn("failed to append retention event", {{"error", emit_error}});
  }
}

void ScanScheduler::WriteStatus(const char* state) {
  if (options_.status_path.empty()) {
    return;
  }
  stats_.uptime_s = ToSeconds(clock_.Now() - started_);

  StatusSnapshot snapshot;
  snapshot.instance_id = options_.instance_id;
  snapshot.updated_at = clock_.WallNow();
  snapshot.state = state;
  snapshot.stats = stats_;
  snapshot.adaptation = controller_.Report();
  snapshot.scan_timing = timing_.Report();
  snapshot.recovery = recovery_.session();

  std::string error;
  if (!WriteStatusJson(snapshot, options_.status_path, error)) {
    logger_.Warn("failed to write status file", {{"error", error}});
  }
}

void ScanScheduler::RaiseAlert(const notify::AlertSeverity severity, const std::string& message) {
  std::string error;
  if (!alerts_.RaiseAlert(severity, message, error)) {
    logger_.Warn("failed to raise alert", {{"severity", notify::ToString(severity)},
                                           {"error", error}});
  }
}

} // namespace loadwatch::scheduler
