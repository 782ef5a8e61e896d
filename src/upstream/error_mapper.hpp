#pragma once

#include <string>
#include <string_view>

namespace loadwatch::upstream {

// Stable classification for upstream failures.
//
// Raw upstream text varies by site and transport; logs, events and the status
// file carry these codes instead so they stay grep-friendly.
enum class UpstreamErrorCode {
  kTimeout,
  kRateLimited,
  kSessionExpired,
  kLayoutDrift,
  kTransport,
  kAccessDenied,
  kUnknown,
};

std::string_view ToStableErrorCode(UpstreamErrorCode code);

struct UpstreamErrorMapping {
  UpstreamErrorCode code = UpstreamErrorCode::kUnknown;
  std::string actionable_message;
  std::string detail;
};

// `operation` is a short label ("fetch", "rebuild", "authenticate", "probe").
UpstreamErrorMapping MapUpstreamError(std::string_view operation, std::string_view detail);

// Single-line form:
//   "<STABLE_CODE>: <actionable_message> detail: <raw_detail>"
// The detail suffix is omitted when raw detail is empty.
std::string FormatUpstreamError(std::string_view operation, std::string_view detail);

} // namespace loadwatch::upstream
