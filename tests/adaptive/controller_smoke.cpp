#include "../common/assertions.hpp"
#include "adaptive/controller.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace {

using loadwatch::adaptive::HealthMetrics;
using loadwatch::adaptive::ScanStrategy;
using loadwatch::tests::common::AssertNear;
using loadwatch::tests::common::AssertTrue;
using loadwatch::tests::common::Fail;

HealthMetrics MakeMetrics(double success_rate, double avg_response_time_s, double error_count,
                          std::uint32_t empty_scans) {
  HealthMetrics metrics;
  metrics.success_rate = success_rate;
  metrics.avg_response_time_s = avg_response_time_s;
  metrics.error_count = error_count;
  metrics.consecutive_empty_scans = empty_scans;
  return metrics;
}

std::string Describe(const HealthMetrics& m) {
  return "sr=" + std::to_string(m.success_rate) + " rt=" + std::to_string(m.avg_response_time_s) +
         " err=" + std::to_string(m.error_count) +
         " empty=" + std::to_string(m.consecutive_empty_scans);
}

void AssertStrategy(const ScanStrategy& strategy, double interval_s, std::uint32_t concurrency,
                    double timeout_s, std::string_view label) {
  AssertNear(strategy.interval_s, interval_s, 1e-12, std::string(label) + " interval");
  AssertTrue(strategy.concurrent_requests == concurrency, std::string(label) + " concurrency");
  AssertNear(strategy.timeout_s, timeout_s, 1e-12, std::string(label) + " timeout");
}

} // namespace

int main() {
  using loadwatch::adaptive::AdaptationLevel;
  using loadwatch::adaptive::ClassifyLevel;
  using loadwatch::adaptive::Controller;
  using loadwatch::adaptive::DeriveStrategy;
  using loadwatch::adaptive::ShouldTriggerRecovery;

  // Level classification.
  AssertTrue(ClassifyLevel(MakeMetrics(1.0, 1.0, 0, 0)) == AdaptationLevel::kOptimal, "optimal");
  AssertTrue(ClassifyLevel(MakeMetrics(0.96, 3.5, 0, 0)) == AdaptationLevel::kGood,
             "slow but successful is good");
  AssertTrue(ClassifyLevel(MakeMetrics(0.9, 1.0, 0, 0)) == AdaptationLevel::kGood, "good");
  AssertTrue(ClassifyLevel(MakeMetrics(0.9, 6.0, 0, 0)) == AdaptationLevel::kDegraded,
             "very slow is degraded");
  AssertTrue(ClassifyLevel(MakeMetrics(0.7, 1.0, 0, 0)) == AdaptationLevel::kDegraded,
             "degraded");
  AssertTrue(ClassifyLevel(MakeMetrics(0.6, 1.0, 0, 0)) == AdaptationLevel::kCritical,
             "0.6 is not above the degraded bound");

  // Healthy metrics pick the aggressive strategy.
  {
    const auto strategy = DeriveStrategy(MakeMetrics(1.0, 1.0, 0, 0));
    AssertStrategy(strategy, 2.0, 5, 15.0, "aggressive");
    AssertTrue(strategy.fast_path_transport, "aggressive enables fast path");
    AssertTrue(!strategy.diagnostics_on_error, "aggressive disables diagnostics");
  }

  // Neither degraded nor healthy keeps the baseline.
  AssertTrue(DeriveStrategy(MakeMetrics(0.9, 1.0, 0, 0)) ==
                 loadwatch::adaptive::BaselineStrategy(),
             "baseline for middling health");

  // Rule 1: high error count.
  {
    const auto strategy = DeriveStrategy(MakeMetrics(0.9, 1.0, 6, 0));
    AssertStrategy(strategy, 5.0, 1, 15.0, "high errors");
    AssertTrue(strategy.diagnostics_on_error, "high errors enable diagnostics");
    AssertTrue(strategy.max_retries == 1U, "high errors cut retries");
  }

  // Rule 2: slow upstream.
  AssertStrategy(DeriveStrategy(MakeMetrics(0.9, 6.0, 0, 0)), 4.0, 3, 30.0, "slow");
  AssertStrategy(DeriveStrategy(MakeMetrics(0.9, 6.0, 6, 0)), 5.0, 1, 30.0, "slow with errors");

  // Rule 3: long empty streak, capped at 10s.
  {
    const auto strategy = DeriveStrategy(MakeMetrics(1.0, 1.0, 0, 11));
    AssertStrategy(strategy, 4.0, 3, 15.0, "empty streak");
    AssertTrue(!strategy.fast_path_transport, "empty streak disables fast path");
    AssertStrategy(DeriveStrategy(MakeMetrics(0.9, 6.0, 6, 11)), 7.0, 1, 30.0,
                   "empty streak stacked");
  }

  // Rule 4 overrides everything before it.
  {
    const auto strategy = DeriveStrategy(MakeMetrics(0.5, 6.0, 6, 11));
    AssertStrategy(strategy, 8.0, 1, 45.0, "low success");
    AssertTrue(strategy.diagnostics_on_error, "low success enables diagnostics");
  }

  // Rule 5 never applies once a degraded rule matched.
  AssertTrue(!DeriveStrategy(MakeMetrics(0.99, 1.0, 0, 11)).fast_path_transport,
             "aggressive must not re-enable fast path over an empty streak");

  // Worse metrics never yield a shorter interval or more concurrency.
  {
    const std::vector<double> success_rates = {0.1, 0.5, 0.65, 0.75, 0.9, 0.97, 1.0};
    const std::vector<double> response_times = {1.0, 2.9, 4.0, 6.0, 20.0, 40.0};
    const std::vector<double> error_counts = {0.0, 1.0, 3.0, 6.0, 25.0};
    const std::vector<std::uint32_t> empty_scans = {0, 5, 11, 60};

    std::vector<HealthMetrics> grid;
    for (const double sr : success_rates) {
      for (const double rt : response_times) {
        for (const double err : error_counts) {
          for (const std::uint32_t empty : empty_scans) {
            grid.push_back(MakeMetrics(sr, rt, err, empty));
          }
        }
      }
    }

    for (const auto& better : grid) {
      const auto better_strategy = DeriveStrategy(better);
      for (const auto& worse : grid) {
        const bool strictly_worse = worse.success_rate < better.success_rate &&
                                    worse.avg_response_time_s > better.avg_response_time_s &&
                                    worse.error_count > better.error_count &&
                                    worse.consecutive_empty_scans > better.consecutive_empty_scans;
        if (!strictly_worse) {
          continue;
        }
        const auto worse_strategy = DeriveStrategy(worse);
        if (worse_strategy.interval_s < better_strategy.interval_s ||
            worse_strategy.concurrent_requests > better_strategy.concurrent_requests) {
          Fail("strategy not monotonic: worse {" + Describe(worse) + "} better {" +
               Describe(better) + "}");
        }
      }
    }
  }

  // Recovery trigger thresholds.
  AssertTrue(ShouldTriggerRecovery(MakeMetrics(0.2, 1.0, 25, 0)), "low success with errors");
  AssertTrue(ShouldTriggerRecovery(MakeMetrics(0.29, 1.0, 0, 0)), "success below 0.3");
  AssertTrue(ShouldTriggerRecovery(MakeMetrics(1.0, 1.0, 21, 0)), "errors above 20");
  AssertTrue(ShouldTriggerRecovery(MakeMetrics(1.0, 31.0, 0, 0)), "response above 30s");
  AssertTrue(ShouldTriggerRecovery(MakeMetrics(1.0, 1.0, 0, 51)), "empty streak above 50");
  AssertTrue(!ShouldTriggerRecovery(MakeMetrics(0.3, 30.0, 20, 50)), "boundaries do not trigger");

  // Controller owns the metrics and re-derives on every query.
  {
    Controller controller;
    AssertTrue(controller.Level() == AdaptationLevel::kOptimal, "fresh controller is optimal");
    for (int i = 0; i < 10; ++i) {
      controller.UpdateMetrics(0.0, 0, 1.0, false);
    }
    AssertTrue(controller.Level() == AdaptationLevel::kCritical, "all failures are critical");
    AssertTrue(controller.ShouldTriggerRecovery(), "all failures trigger recovery");
    const auto report = controller.Report();
    AssertTrue(report.recovery_recommended, "report mirrors recovery trigger");
    AssertTrue(report.strategy == controller.DeriveStrategy(), "report mirrors strategy");
    AssertTrue(report.metrics.samples == 10U, "report carries metrics");
  }

  return 0;
}
