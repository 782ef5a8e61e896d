#include "core/shutdown_signal.hpp"

#include <algorithm>

namespace loadwatch::core {

namespace {

constexpr auto kSignalPollSlice = std::chrono::milliseconds(50);

} // namespace

void ShutdownSignal::RequestStop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_.store(true);
  }
  cv_.notify_all();
}

void ShutdownSignal::RequestStopFromSignalHandler() {
  stop_requested_.store(true);
}

bool ShutdownSignal::StopRequested() const {
  return stop_requested_.load();
}

bool ShutdownSignal::WaitFor(const std::chrono::steady_clock::duration duration) const {
  const auto deadline = std::chrono::steady_clock::now() + duration;
  std::unique_lock<std::mutex> lock(mu_);
  while (!stop_requested_.load()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now,
                                                                     kSignalPollSlice);
    cv_.wait_for(lock, slice);
  }
  return true;
}

} // namespace loadwatch::core
