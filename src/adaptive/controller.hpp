#pragma once

#include "adaptive/health_metrics.hpp"
#include "adaptive/scan_strategy.hpp"

#include <cstdint>
#include <string_view>

namespace loadwatch::adaptive {

// Coarse health classification, recomputed from metrics on every query.
enum class AdaptationLevel {
  kOptimal,
  kGood,
  kDegraded,
  kCritical,
};

const char* ToString(AdaptationLevel level);
bool ParseAdaptationLevel(std::string_view text, AdaptationLevel& level);

// Level thresholds.
constexpr double kOptimalSuccessRate = 0.95;
constexpr double kOptimalMaxResponseS = 3.0;
constexpr double kGoodSuccessRate = 0.8;
constexpr double kGoodMaxResponseS = 5.0;
constexpr double kDegradedSuccessRate = 0.6;

// Strategy rule thresholds.
constexpr double kHighErrorCount = 5.0;
constexpr double kSlowResponseS = 5.0;
constexpr std::uint32_t kLongEmptyStreak = 10;
constexpr double kLowSuccessRate = 0.7;
constexpr double kAggressiveMaxErrorCount = 2.0;
constexpr double kMaxIntervalS = 10.0;

// Recovery trigger thresholds.
constexpr double kRecoverySuccessRate = 0.3;
constexpr double kRecoveryErrorCount = 20.0;
constexpr double kRecoveryResponseS = 30.0;
constexpr std::uint32_t kRecoveryEmptyStreak = 50;

AdaptationLevel ClassifyLevel(const HealthMetrics& metrics);

// Baseline, then rules from least to most severe so the worst observed
// condition wins:
//   1. error_count > 5           -> 5s, 1 request, diagnostics, 1 retry
//   2. avg response > 5s         -> 30s timeout, interval >= 4s
//   3. empty streak > 10         -> interval + 2s (max 10s), no fast path
//   4. success_rate < 0.7        -> 8s, 1 request, 45s timeout, diagnostics
//   5. none of the above and healthy (sr > 0.95, avg < 3s, errors < 2)
//                                -> 2s, 5 requests, 15s, fast path
ScanStrategy DeriveStrategy(const HealthMetrics& metrics);

bool ShouldTriggerRecovery(const HealthMetrics& metrics);

// Status snapshot for reports and the status file.
struct AdaptationReport {
  AdaptationLevel level = AdaptationLevel::kOptimal;
  HealthMetrics metrics;
  ScanStrategy strategy;
  bool recovery_recommended = false;
};

// Owns the controller state for one process. Single writer: only the scan
// loop calls UpdateMetrics(); everything else reads snapshots.
class Controller {
public:
  Controller() = default;

  void UpdateMetrics(double response_time_s, std::uint32_t loads_found, double error_count_delta,
                     bool success);

  ScanStrategy DeriveStrategy() const;
  AdaptationLevel Level() const;
  bool ShouldTriggerRecovery() const;
  AdaptationReport Report() const;

  const HealthMetrics& metrics() const {
    return metrics_;
  }

private:
  HealthMetrics metrics_;
};

} // namespace loadwatch::adaptive
