#pragma once

namespace loadwatch::core::errors {

// Stable process-exit contract for service supervisors and wrappers.
//
// 0/1/2 keep their conventional meanings. The remaining values let a
// supervisor tell "fix the config" apart from "upstream never came up" and
// "recovery gave up; operator restart required".
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kUpstreamUnavailable = 20,
  kRecoveryEscalated = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace loadwatch::core::errors
