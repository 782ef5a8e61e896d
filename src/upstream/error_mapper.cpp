#include "upstream/error_mapper.hpp"

#include "core/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>

namespace loadwatch::upstream {

namespace {

std::string CollapseWhitespace(std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  bool previous_was_space = true;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!previous_was_space) {
        normalized.push_back(' ');
      }
      previous_was_space = true;
      continue;
    }
    normalized.push_back(c);
    previous_was_space = false;
  }
  if (!normalized.empty() && normalized.back() == ' ') {
    normalized.pop_back();
  }
  return normalized;
}

bool ContainsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
  for (const std::string_view needle : needles) {
    if (!needle.empty() && haystack.find(needle) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

std::string BuildActionableMessage(const UpstreamErrorCode code, std::string_view operation) {
  const std::string label = operation.empty() ? "upstream call" : std::string(operation);

  switch (code) {
  case UpstreamErrorCode::kTimeout:
    return "Upstream timed out during " + label + "; the controller will widen timeouts.";
  case UpstreamErrorCode::kRateLimited:
    return "Upstream rate limited " + label + "; scan interval will back off.";
  case UpstreamErrorCode::kSessionExpired:
    return "Upstream session expired during " + label + "; recovery will re-authenticate.";
  case UpstreamErrorCode::kLayoutDrift:
    return "Upstream result layout changed during " + label +
           "; review the extraction collaborator.";
  case UpstreamErrorCode::kTransport:
    return "Transport failure during " + label + "; check network reachability.";
  case UpstreamErrorCode::kAccessDenied:
    return "Access denied during " + label + "; verify account credentials.";
  case UpstreamErrorCode::kUnknown:
  default:
    return "Unexpected upstream failure during " + label + "; inspect diagnostics.";
  }
}

UpstreamErrorCode ClassifyFromNormalizedDetail(const std::string& normalized) {
  if (normalized.empty()) {
    return UpstreamErrorCode::kUnknown;
  }
  if (ContainsAny(normalized, {"timeout", "timed out", "deadline exceeded"})) {
    return UpstreamErrorCode::kTimeout;
  }
  if (ContainsAny(normalized, {"rate limit", "too many requests", "429", "throttl"})) {
    return UpstreamErrorCode::kRateLimited;
  }
  if (ContainsAny(normalized, {"session expired", "login required", "logged out",
                               "not authenticated", "session"})) {
    return UpstreamErrorCode::kSessionExpired;
  }
  if (ContainsAny(normalized, {"forbidden", "access denied", "unauthorized", "403", "401"})) {
    return UpstreamErrorCode::kAccessDenied;
  }
  if (ContainsAny(normalized, {"selector", "element not found", "layout", "no results table",
                               "parse"})) {
    return UpstreamErrorCode::kLayoutDrift;
  }
  if (ContainsAny(normalized, {"connection", "reset", "refused", "unreachable", "dns",
                               "502", "503", "504", "transport"})) {
    return UpstreamErrorCode::kTransport;
  }
  return UpstreamErrorCode::kUnknown;
}

} // namespace

std::string_view ToStableErrorCode(const UpstreamErrorCode code) {
  switch (code) {
  case UpstreamErrorCode::kTimeout:
    return "UPSTREAM_TIMEOUT";
  case UpstreamErrorCode::kRateLimited:
    return "UPSTREAM_RATE_LIMITED";
  case UpstreamErrorCode::kSessionExpired:
    return "UPSTREAM_SESSION_EXPIRED";
  case UpstreamErrorCode::kLayoutDrift:
    return "UPSTREAM_LAYOUT_DRIFT";
  case UpstreamErrorCode::kTransport:
    return "UPSTREAM_TRANSPORT";
  case UpstreamErrorCode::kAccessDenied:
    return "UPSTREAM_ACCESS_DENIED";
  case UpstreamErrorCode::kUnknown:
  default:
    return "UPSTREAM_UNKNOWN_ERROR";
  }
}

UpstreamErrorMapping MapUpstreamError(std::string_view operation, std::string_view detail) {
  UpstreamErrorMapping mapped;
  mapped.detail = CollapseWhitespace(detail);
  mapped.code = ClassifyFromNormalizedDetail(core::ToLowerAscii(mapped.detail));
  mapped.actionable_message = BuildActionableMessage(mapped.code, operation);
  return mapped;
}

std::string FormatUpstreamError(std::string_view operation, std::string_view detail) {
  const UpstreamErrorMapping mapped = MapUpstreamError(operation, detail);
  std::string formatted =
      std::string(ToStableErrorCode(mapped.code)) + ": " + mapped.actionable_message;
  if (!mapped.detail.empty()) {
    formatted += " detail: " + mapped.detail;
  }
  return formatted;
}

} // namespace loadwatch::upstream
