#include "../common/assertions.hpp"
#include "upstream/error_mapper.hpp"

#include <string>
#include <string_view>

namespace {

void AssertCode(std::string_view detail, std::string_view expected_code) {
  const auto mapping = loadwatch::upstream::MapUpstreamError("fetch", detail);
  const std::string_view actual = loadwatch::upstream::ToStableErrorCode(mapping.code);
  if (actual != expected_code) {
    loadwatch::tests::common::Fail("detail '" + std::string(detail) + "' mapped to " +
                                   std::string(actual) + ", expected " +
                                   std::string(expected_code));
  }
}

} // namespace

int main() {
  using loadwatch::tests::common::AssertContains;
  using loadwatch::tests::common::AssertNotContains;

  AssertCode("navigation Timeout 15000ms exceeded", "UPSTREAM_TIMEOUT");
  AssertCode("deadline exceeded", "UPSTREAM_TIMEOUT");
  AssertCode("HTTP 429 Too Many Requests", "UPSTREAM_RATE_LIMITED");
  AssertCode("session expired: login required", "UPSTREAM_SESSION_EXPIRED");
  AssertCode("403 Forbidden", "UPSTREAM_ACCESS_DENIED");
  AssertCode("selector '#loads-table' element not found", "UPSTREAM_LAYOUT_DRIFT");
  AssertCode("connection reset by peer", "UPSTREAM_TRANSPORT");
  AssertCode("502 bad gateway", "UPSTREAM_TRANSPORT");
  AssertCode("something odd happened", "UPSTREAM_UNKNOWN_ERROR");
  AssertCode("", "UPSTREAM_UNKNOWN_ERROR");

  const std::string formatted =
      loadwatch::upstream::FormatUpstreamError("probe", "probe timed out");
  AssertContains(formatted, "UPSTREAM_TIMEOUT: ");
  AssertContains(formatted, "during probe");
  AssertContains(formatted, " detail: probe timed out");

  const std::string bare = loadwatch::upstream::FormatUpstreamError("rebuild", "");
  AssertContains(bare, "UPSTREAM_UNKNOWN_ERROR: ");
  AssertNotContains(bare, "detail:");

  const auto mapping = loadwatch::upstream::MapUpstreamError("fetch", "  Rate Limit hit ");
  AssertContains(mapping.actionable_message, "scan interval will back off");
  return 0;
}
