#include "core/clock.hpp"

namespace loadwatch::core {

Clock::TimePoint SteadyClock::Now() const {
  return std::chrono::steady_clock::now();
}

Clock::WallTimePoint SteadyClock::WallNow() const {
  return std::chrono::system_clock::now();
}

bool SteadyClock::SleepFor(const Duration duration, const ShutdownSignal& shutdown) {
  if (duration <= Duration::zero()) {
    return !shutdown.StopRequested();
  }
  return !shutdown.WaitFor(duration);
}

Clock::Duration SecondsToDuration(const double seconds) {
  if (!(seconds > 0.0)) {
    return Clock::Duration::zero();
  }
  return std::chrono::duration_cast<Clock::Duration>(std::chrono::duration<double>(seconds));
}

} // namespace loadwatch::core
