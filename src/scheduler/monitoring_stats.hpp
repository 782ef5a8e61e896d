#pragma once

#include "dispatch/pipeline.hpp"

#include <chrono>
#include <cstdint>

namespace loadwatch::scheduler {

// Process-lifetime counters for the scan loop. Written by the scheduler thread
// only; the status file publishes a snapshot.
struct MonitoringStats {
  std::chrono::system_clock::time_point started_at{};
  double uptime_s = 0.0;
  std::uint64_t scan_count = 0;
  std::uint64_t failed_scans = 0;
  std::uint64_t loads_found_total = 0;
  std::uint64_t loads_sent_total = 0;
  std::uint64_t dispatch_failures = 0;
  std::uint64_t persist_failures = 0;
  std::uint64_t abandoned_total = 0;
  std::uint64_t recoveries_started = 0;
  std::uint64_t recoveries_succeeded = 0;
  std::uint64_t retention_removed_total = 0;
  dispatch::DispatchSummary last_dispatch;
};

} // namespace loadwatch::scheduler
