#pragma once

#include <string_view>

namespace loadwatch::core::errors {

// Failure taxonomy for the scan core. Each class has exactly one propagation
// rule; callers classify instead of rethrowing.
//
// - kTransientUpstream: absorbed into health metrics by the scheduler.
// - kDedupConflict: expected outcome; skipped silently.
// - kItemDispatch: logged per item; siblings and the batch continue.
// - kHealthCritical: handed from the controller to the recovery manager.
// - kRecoveryExhausted: fatal alert, scheduler halts, operator restart.
enum class FailureClass {
  kNone,
  kTransientUpstream,
  kDedupConflict,
  kItemDispatch,
  kHealthCritical,
  kRecoveryExhausted,
};

constexpr std::string_view ToStableCode(FailureClass failure) {
  switch (failure) {
  case FailureClass::kNone:
    return "NONE";
  case FailureClass::kTransientUpstream:
    return "TRANSIENT_UPSTREAM";
  case FailureClass::kDedupConflict:
    return "DEDUP_CONFLICT";
  case FailureClass::kItemDispatch:
    return "ITEM_DISPATCH";
  case FailureClass::kHealthCritical:
    return "HEALTH_CRITICAL";
  case FailureClass::kRecoveryExhausted:
    return "RECOVERY_EXHAUSTED";
  }
  return "NONE";
}

// True only for the class that must stop the scan loop.
constexpr bool IsFatal(FailureClass failure) {
  return failure == FailureClass::kRecoveryExhausted;
}

} // namespace loadwatch::core::errors
