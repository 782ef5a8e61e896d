#include "metrics/scan_timing.hpp"

#include <algorithm>
#include <numeric>

namespace loadwatch::metrics {

namespace {

double AverageOfLast(const std::deque<double>& history, const std::size_t count) {
  if (history.empty()) {
    return 0.0;
  }
  const std::size_t n = std::min(count, history.size());
  const double sum = std::accumulate(history.end() - static_cast<std::ptrdiff_t>(n),
                                     history.end(), 0.0);
  return sum / static_cast<double>(n);
}

} // namespace

double ComputePerformanceScore(const double avg_scan_ms) {
  double score = 100.0;
  if (avg_scan_ms > 10000.0) {
    score -= 30.0;
  } else if (avg_scan_ms > 5000.0) {
    score -= 15.0;
  } else if (avg_scan_ms > 2000.0) {
    score -= 5.0;
  }
  return std::max(0.0, score);
}

bool ScanTimingTracker::Track(const double scan_ms) {
  history_.push_back(scan_ms);
  if (history_.size() > kScanTimingHistory) {
    history_.pop_front();
  }
  ++total_scans_;
  return scan_ms > kSlowScanMs;
}

ScanTimingReport ScanTimingTracker::Report() const {
  ScanTimingReport report;
  report.total_scans = total_scans_;
  if (!history_.empty()) {
    const auto [min_it, max_it] = std::minmax_element(history_.begin(), history_.end());
    report.min_ms = *min_it;
    report.max_ms = *max_it;
    report.avg_ms = AverageOfLast(history_, history_.size());
    report.recent_avg_ms = AverageOfLast(history_, 10U);
    report.scale_down_recommended = AverageOfLast(history_, 5U) > kVerySlowRecentScanMs;
  }
  report.performance_score = ComputePerformanceScore(report.avg_ms);

  if (report.avg_ms > kSlowScanMs) {
    report.recommendations.push_back("increase scan interval");
    report.recommendations.push_back("reduce concurrent upstream requests");
  }
  if (report.scale_down_recommended) {
    report.recommendations.push_back("recent scans are very slow; scale down scanning");
  }
  if (report.recommendations.empty()) {
    report.recommendations.push_back("scan performance nominal");
  }
  return report;
}

} // namespace loadwatch::metrics
