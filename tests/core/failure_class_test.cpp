#include "core/errors/exit_codes.hpp"
#include "core/errors/failure_class.hpp"

#include <catch2/catch.hpp>

TEST_CASE("Failure classes keep stable codes", "[core][errors]") {
  using loadwatch::core::errors::FailureClass;
  using loadwatch::core::errors::ToStableCode;

  REQUIRE(ToStableCode(FailureClass::kTransientUpstream) == "TRANSIENT_UPSTREAM");
  REQUIRE(ToStableCode(FailureClass::kDedupConflict) == "DEDUP_CONFLICT");
  REQUIRE(ToStableCode(FailureClass::kItemDispatch) == "ITEM_DISPATCH");
  REQUIRE(ToStableCode(FailureClass::kHealthCritical) == "HEALTH_CRITICAL");
  REQUIRE(ToStableCode(FailureClass::kRecoveryExhausted) == "RECOVERY_EXHAUSTED");
}

TEST_CASE("Only exhausted recovery is fatal", "[core][errors]") {
  using loadwatch::core::errors::FailureClass;
  using loadwatch::core::errors::IsFatal;

  REQUIRE(IsFatal(FailureClass::kRecoveryExhausted));
  REQUIRE_FALSE(IsFatal(FailureClass::kHealthCritical));
  REQUIRE_FALSE(IsFatal(FailureClass::kItemDispatch));
  REQUIRE_FALSE(IsFatal(FailureClass::kTransientUpstream));
}

TEST_CASE("Exit codes match the supervisor contract", "[core][errors]") {
  using loadwatch::core::errors::ExitCode;
  using loadwatch::core::errors::ToInt;

  REQUIRE(ToInt(ExitCode::kSuccess) == 0);
  REQUIRE(ToInt(ExitCode::kUsage) == 2);
  REQUIRE(ToInt(ExitCode::kConfigInvalid) == 10);
  REQUIRE(ToInt(ExitCode::kUpstreamUnavailable) == 20);
  REQUIRE(ToInt(ExitCode::kRecoveryEscalated) == 30);
}
