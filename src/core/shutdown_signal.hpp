#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace loadwatch::core {

// Process-wide stop request observed by the scheduler loop, dispatch workers
// and the recovery manager at every boundary where they may block.
//
// RequestStopFromSignalHandler() only stores a lock-free atomic and is safe to
// call from a POSIX signal handler; waiters poll the flag in short slices so a
// handler-initiated stop is noticed without a notify.
class ShutdownSignal {
public:
  ShutdownSignal() = default;

  ShutdownSignal(const ShutdownSignal&) = delete;
  ShutdownSignal& operator=(const ShutdownSignal&) = delete;

  void RequestStop();
  void RequestStopFromSignalHandler();

  bool StopRequested() const;

  // Blocks for up to `duration`. Returns true when a stop was requested before
  // or during the wait.
  bool WaitFor(std::chrono::steady_clock::duration duration) const;

private:
  std::atomic<bool> stop_requested_{false};
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
};

} // namespace loadwatch::core
