#pragma once

#include "core/shutdown_signal.hpp"

#include <chrono>

namespace loadwatch::core {

// Time source for the scan loop and recovery manager.
//
// Cadence, cooldown and backoff logic read `Now()` from the monotonic clock so
// wall-clock jumps never shorten a cooldown; persisted records and events use
// `WallNow()`. Tests substitute a manual clock so multi-minute backoff
// schedules run instantly.
class Clock {
public:
  using TimePoint = std::chrono::steady_clock::time_point;
  using Duration = std::chrono::steady_clock::duration;
  using WallTimePoint = std::chrono::system_clock::time_point;

  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
  virtual WallTimePoint WallNow() const = 0;

  // Sleeps for `duration` unless `shutdown` fires first. Returns false when the
  // sleep was cut short by a stop request.
  virtual bool SleepFor(Duration duration, const ShutdownSignal& shutdown) = 0;
};

class SteadyClock final : public Clock {
public:
  TimePoint Now() const override;
  WallTimePoint WallNow() const override;
  bool SleepFor(Duration duration, const ShutdownSignal& shutdown) override;
};

// Converts fractional seconds (config and strategy units) to a clock duration.
Clock::Duration SecondsToDuration(double seconds);

} // namespace loadwatch::core
