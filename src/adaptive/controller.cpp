#include "adaptive/controller.hpp"

#include <algorithm>

namespace loadwatch::adaptive {

const char* ToString(const AdaptationLevel level) {
  switch (level) {
  case AdaptationLevel::kOptimal:
    return "OPTIMAL";
  case AdaptationLevel::kGood:
    return "GOOD";
  case AdaptationLevel::kDegraded:
    return "DEGRADED";
  case AdaptationLevel::kCritical:
    return "CRITICAL";
  }
  return "CRITICAL";
}

bool ParseAdaptationLevel(std::string_view text, AdaptationLevel& level) {
  if (text == "OPTIMAL") {
    level = AdaptationLevel::kOptimal;
    return true;
  }
  if (text == "GOOD") {
    level = AdaptationLevel::kGood;
    return true;
  }
  if (text == "DEGRADED") {
    level = AdaptationLevel::kDegraded;
    return true;
  }
  if (text == "CRITICAL") {
    level = AdaptationLevel::kCritical;
    return true;
  }
  return false;
}

AdaptationLevel ClassifyLevel(const HealthMetrics& metrics) {
  if (metrics.success_rate > kOptimalSuccessRate &&
      metrics.avg_response_time_s < kOptimalMaxResponseS) {
    return AdaptationLevel::kOptimal;
  }
  if (metrics.success_rate > kGoodSuccessRate && metrics.avg_response_time_s < kGoodMaxResponseS) {
    return AdaptationLevel::kGood;
  }
  if (metrics.success_rate > kDegradedSuccessRate) {
    return AdaptationLevel::kDegraded;
  }
  return AdaptationLevel::kCritical;
}

ScanStrategy DeriveStrategy(const HealthMetrics& metrics) {
  ScanStrategy strategy = BaselineStrategy();
  bool degraded_rule_matched = false;

  if (metrics.error_count > kHighErrorCount) {
    strategy.interval_s = 5.0;
    strategy.concurrent_requests = 1;
    strategy.diagnostics_on_error = true;
    strategy.max_retries = 1;
    degraded_rule_matched = true;
  }

  if (metrics.avg_response_time_s > kSlowResponseS) {
    strategy.timeout_s = 30.0;
    strategy.interval_s = std::max(strategy.interval_s, 4.0);
    degraded_rule_matched = true;
  }

  if (metrics.consecutive_empty_scans > kLongEmptyStreak) {
    strategy.interval_s = std::min(strategy.interval_s + 2.0, kMaxIntervalS);
    strategy.fast_path_transport = false;
    degraded_rule_matched = true;
  }

  if (metrics.success_rate < kLowSuccessRate) {
    strategy.interval_s = 8.0;
    strategy.concurrent_requests = 1;
    strategy.timeout_s = 45.0;
    strategy.diagnostics_on_error = true;
    degraded_rule_matched = true;
  }

  if (!degraded_rule_matched && metrics.success_rate > kOptimalSuccessRate &&
      metrics.avg_response_time_s < kOptimalMaxResponseS &&
      metrics.error_count < kAggressiveMaxErrorCount) {
    strategy.interval_s = 2.0;
    strategy.concurrent_requests = 5;
    strategy.timeout_s = 15.0;
    strategy.fast_path_transport = true;
  }

  return strategy;
}

bool ShouldTriggerRecovery(const HealthMetrics& metrics) {
  return metrics.success_rate < kRecoverySuccessRate ||
         metrics.error_count > kRecoveryErrorCount ||
         metrics.avg_response_time_s > kRecoveryResponseS ||
         metrics.consecutive_empty_scans > kRecoveryEmptyStreak;
}

void Controller::UpdateMetrics(const double response_time_s, const std::uint32_t loads_found,
                               const double error_count_delta, const bool success) {
  ApplyScanSample(metrics_, response_time_s, loads_found, error_count_delta, success);
}

ScanStrategy Controller::DeriveStrategy() const {
  return adaptive::DeriveStrategy(metrics_);
}

AdaptationLevel Controller::Level() const {
  return ClassifyLevel(metrics_);
}

bool Controller::ShouldTriggerRecovery() const {
  return adaptive::ShouldTriggerRecovery(metrics_);
}

AdaptationReport Controller::Report() const {
  return AdaptationReport{
      .level = Level(),
      .metrics = metrics_,
      .strategy = DeriveStrategy(),
      .recovery_recommended = ShouldTriggerRecovery(),
  };
}

} // namespace loadwatch::adaptive
