#pragma once

#include "adaptive/controller.hpp"
#include "core/clock.hpp"
#include "dispatch/pipeline.hpp"
#include "dispatch/search_criteria.hpp"
#include "metrics/scan_timing.hpp"
#include "notify/alert_sink.hpp"
#include "scheduler/monitoring_stats.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace loadwatch::core {
class ShutdownSignal;
}

namespace loadwatch::core::logging {
class Logger;
}

namespace loadwatch::dispatch {
class ISentStore;
}

namespace loadwatch::events {
class Emitter;
}

namespace loadwatch::recovery {
class RecoveryManager;
}

namespace loadwatch::upstream {
class IUpstream;
}

namespace loadwatch::scheduler {

enum class SchedulerExit {
  kShutdown,
  kMaxCycles,
  // Recovery exhausted; the loop must not restart on its own.
  kEscalated,
};

const char* ToString(SchedulerExit exit);

struct SchedulerOptions {
  std::string instance_id = "loadwatch";
  dispatch::SearchCriteria criteria;
  // 0 runs until shutdown or escalation.
  std::uint64_t max_cycles = 0;
  std::uint32_t status_every_cycles = 10;
  double alert_interval_s = 1800.0;
  std::uint32_t retention_days = 7;
  double retention_sweep_interval_s = 3600.0;
  // Empty disables the status file.
  std::filesystem::path status_path;
};

struct SchedulerResult {
  SchedulerExit exit = SchedulerExit::kShutdown;
  std::uint64_t cycles = 0;
  MonitoringStats stats;
};

// Cooperative scan loop. Runs on the calling thread and is the only caller of
// the upstream fetch.
//
// Per tick: fetch with the current strategy snapshot, dispatch the batch,
// fold timing and outcome into the controller, derive the next strategy, then
// sleep for what is left of the interval. Tick k+1 never starts before tick k's
// dispatch has drained and its strategy has been derived.
class ScanScheduler {
public:
  ScanScheduler(upstream::IUpstream& upstream, dispatch::DispatchPipeline& pipeline,
                adaptive::Controller& controller, recovery::RecoveryManager& recovery,
                dispatch::ISentStore& store, notify::IAlertSink& alerts, events::Emitter& emitter,
                core::logging::Logger& logger, core::Clock& clock,
                const core::ShutdownSignal& shutdown, SchedulerOptions options);

  SchedulerResult Run();

  const MonitoringStats& stats() const {
    return stats_;
  }

  const metrics::ScanTimingTracker& timing() const {
    return timing_;
  }

private:
  // Returns the exit reason when the tick ends the loop.
  std::optional<SchedulerExit> RunTick(std::uint64_t cycle, adaptive::ScanStrategy& strategy);
  void ObserveAdaptation(std::uint64_t cycle, adaptive::ScanStrategy& strategy);
  void MaybeRaiseDegradedAlert();
  void MaybeSweepRetention();
  void WriteStatus(const char* state);
  void RaiseAlert(notify::AlertSeverity severity, const std::string& message);

  upstream::IUpstream& upstream_;
  dispatch::DispatchPipeline& pipeline_;
  adaptive::Controller& controller_;
  recovery::RecoveryManager& recovery_;
  dispatch::ISentStore& store_;
  notify::IAlertSink& alerts_;
  events::Emitter& emitter_;
  core::logging::Logger& logger_;
  core::Clock& clock_;
  const core::ShutdownSignal& shutdown_;
  SchedulerOptions options_;

  MonitoringStats stats_;
  metrics::ScanTimingTracker timing_;
  adaptive::AdaptationLevel level_ = adaptive::AdaptationLevel::kOptimal;
  core::Clock::TimePoint started_{};
  std::optional<core::Clock::TimePoint> last_degraded_alert_;
  std::optional<core::Clock::TimePoint> last_retention_sweep_;
};

} // namespace loadwatch::scheduler
