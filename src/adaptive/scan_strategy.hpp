#pragma once

#include <cstdint>

namespace loadwatch::adaptive {

// Parameters the scheduler reads at the start of each tick. Immutable for
// the duration of that tick.
struct ScanStrategy {
  double interval_s = 2.0;
  std::uint32_t concurrent_requests = 3;
  double timeout_s = 15.0;
  bool diagnostics_on_error = false;
  std::uint32_t max_retries = 3;
  bool fast_path_transport = true;

  bool operator==(const ScanStrategy& other) const = default;
};

inline ScanStrategy BaselineStrategy() {
  return ScanStrategy{};
}

} // namespace loadwatch::adaptive
