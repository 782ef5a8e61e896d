#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace loadwatch::adaptive {

constexpr std::size_t kSuccessWindowCapacity = 100U;
constexpr double kInitialAvgResponseTimeS = 2.0;
constexpr double kResponseTimeSmoothing = 0.2;
constexpr double kErrorDecayPerCycle = 0.1;

// Fixed-capacity ring of scan outcomes. success_rate is the mean of what has
// been pushed so far; an empty window reads as fully successful.
class SuccessWindow {
public:
  void Push(bool success);
  double Mean() const;
  std::size_t size() const {
    return size_;
  }

private:
  std::array<bool, kSuccessWindowCapacity> samples_{};
  std::size_t next_ = 0;
  std::size_t size_ = 0;
  std::size_t successes_ = 0;
};

// Rolling health of the upstream as observed by the scan loop. One writer
// (the scheduler thread), updated once per cycle.
struct HealthMetrics {
  double avg_response_time_s = kInitialAvgResponseTimeS;
  double success_rate = 1.0;
  double error_count = 0.0;
  std::uint32_t consecutive_empty_scans = 0;
  std::uint32_t last_loads_found = 0;
  std::uint64_t samples = 0;
  SuccessWindow window;
};

// Folds one scan cycle into `metrics`:
// - avg_response_time_s moves 20% towards `response_time_s`;
// - zero loads extends the empty streak, anything else resets it;
// - error_count grows by `error_count_delta` when >= 1, else decays by 0.1
//   floored at 0;
// - `success` enters the 100-sample window and success_rate is its mean.
void ApplyScanSample(HealthMetrics& metrics, double response_time_s, std::uint32_t loads_found,
                     double error_count_delta, bool success);

} // namespace loadwatch::adaptive
