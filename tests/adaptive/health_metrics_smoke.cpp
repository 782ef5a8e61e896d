#include "../common/assertions.hpp"
#include "adaptive/health_metrics.hpp"

int main() {
  using loadwatch::adaptive::ApplyScanSample;
  using loadwatch::adaptive::HealthMetrics;
  using loadwatch::adaptive::kSuccessWindowCapacity;
  using loadwatch::adaptive::SuccessWindow;
  using loadwatch::tests::common::AssertNear;
  using loadwatch::tests::common::AssertTrue;

  // Empty window reads as fully successful.
  {
    SuccessWindow window;
    AssertNear(window.Mean(), 1.0, 0.0, "empty window mean");
    window.Push(false);
    window.Push(true);
    AssertNear(window.Mean(), 0.5, 1e-12, "two sample mean");
  }

  // The window keeps only the newest samples.
  {
    SuccessWindow window;
    for (std::size_t i = 0; i < kSuccessWindowCapacity; ++i) {
      window.Push(false);
    }
    AssertNear(window.Mean(), 0.0, 0.0, "all failures");
    for (std::size_t i = 0; i < kSuccessWindowCapacity / 2U; ++i) {
      window.Push(true);
    }
    AssertTrue(window.size() == kSuccessWindowCapacity, "window must stay at capacity");
    AssertNear(window.Mean(), 0.5, 1e-12, "half replaced");
  }

  // Smoothing, empty streak and error decay.
  {
    HealthMetrics metrics;
    ApplyScanSample(metrics, 7.0, 0, 0.0, true);
    AssertNear(metrics.avg_response_time_s, 2.0 * 0.8 + 7.0 * 0.2, 1e-12, "smoothed response");
    AssertTrue(metrics.consecutive_empty_scans == 1U, "empty scan must extend streak");

    ApplyScanSample(metrics, 3.0, 0, 1.0, false);
    AssertTrue(metrics.consecutive_empty_scans == 2U, "streak must keep growing");
    AssertNear(metrics.error_count, 1.0, 1e-12, "error delta applied");
    AssertNear(metrics.success_rate, 0.5, 1e-12, "success rate is window mean");

    ApplyScanSample(metrics, 3.0, 4, 0.0, true);
    AssertTrue(metrics.consecutive_empty_scans == 0U, "loads found must reset streak");
    AssertTrue(metrics.last_loads_found == 4U, "last loads found recorded");
    AssertNear(metrics.error_count, 0.9, 1e-12, "error count decays by 0.1");

    for (int i = 0; i < 20; ++i) {
      ApplyScanSample(metrics, 1.0, 1, 0.0, true);
    }
    AssertNear(metrics.error_count, 0.0, 0.0, "error count floors at zero");
    AssertTrue(metrics.samples == 23U, "sample count");
  }

  return 0;
}
