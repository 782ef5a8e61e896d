#include "adaptive/health_metrics.hpp"

#include <algorithm>

namespace loadwatch::adaptive {

void SuccessWindow::Push(const bool success) {
  if (size_ == kSuccessWindowCapacity) {
    if (samples_[next_]) {
      --successes_;
    }
  } else {
    ++size_;
  }
  samples_[next_] = success;
  if (success) {
    ++successes_;
  }
  next_ = (next_ + 1U) % kSuccessWindowCapacity;
}

double SuccessWindow::Mean() const {
  if (size_ == 0U) {
    return 1.0;
  }
  return static_cast<double>(successes_) / static_cast<double>(size_);
}

void ApplyScanSample(HealthMetrics& metrics, const double response_time_s,
                     const std::uint32_t loads_found, const double error_count_delta,
                     const bool success) {
  metrics.avg_response_time_s = metrics.avg_response_time_s * (1.0 - kResponseTimeSmoothing) +
                                response_time_s * kResponseTimeSmoothing;

  metrics.last_loads_found = loads_found;
  if (loads_found == 0U) {
    ++metrics.consecutive_empty_scans;
  } else {
    metrics.consecutive_empty_scans = 0;
  }

  if (error_count_delta >= 1.0) {
    metrics.error_count += error_count_delta;
  } else {
    metrics.error_count = std::max(0.0, metrics.error_count - kErrorDecayPerCycle);
  }

  metrics.window.Push(success);
  metrics.success_rate = metrics.window.Mean();
  ++metrics.samples;
}

} // namespace loadwatch::adaptive
