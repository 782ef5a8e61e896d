#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace loadwatch::metrics {

constexpr std::size_t kScanTimingHistory = 1000U;
constexpr double kSlowScanMs = 10000.0;
constexpr double kVerySlowRecentScanMs = 15000.0;

// Scan duration summary published in the status file.
//
// - `recent_avg_ms` averages the last 10 scans.
// - `performance_score` starts at 100 and loses 30/15/5 points when the
//   average scan exceeds 10s/5s/2s.
// - `scale_down_recommended` is set when the last 5 scans average above 15s.
struct ScanTimingReport {
  std::uint64_t total_scans = 0;
  double avg_ms = 0.0;
  double min_ms = 0.0;
  double max_ms = 0.0;
  double recent_avg_ms = 0.0;
  double performance_score = 100.0;
  bool scale_down_recommended = false;
  std::vector<std::string> recommendations;
};

// Bounded history of scan durations. Single writer (the scan loop).
class ScanTimingTracker {
public:
  // Records one scan. Returns true when the scan counts as slow.
  bool Track(double scan_ms);

  ScanTimingReport Report() const;

  std::uint64_t total_scans() const {
    return total_scans_;
  }

private:
  std::deque<double> history_;
  std::uint64_t total_scans_ = 0;
};

double ComputePerformanceScore(double avg_scan_ms);

} // namespace loadwatch::metrics
