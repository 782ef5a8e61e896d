#pragma once

#include "adaptive/controller.hpp"
#include "metrics/scan_timing.hpp"
#include "recovery/recovery_manager.hpp"
#include "scheduler/monitoring_stats.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace loadwatch::scheduler {

// Everything the status file reports, captured at one instant.
struct StatusSnapshot {
  std::string instance_id;
  std::chrono::system_clock::time_point updated_at{};
  // "running", "stopped" or "escalated".
  std::string state = "running";
  MonitoringStats stats;
  adaptive::AdaptationReport adaptation;
  metrics::ScanTimingReport scan_timing;
  recovery::RecoverySession recovery;
};

std::string BuildStatusJson(const StatusSnapshot& snapshot);

// Publishes status.json atomically so an operator never reads a torn file.
bool WriteStatusJson(const StatusSnapshot& snapshot, const std::filesystem::path& output_path,
                     std::string& error);

} // namespace loadwatch::scheduler
