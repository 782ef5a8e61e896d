#include "events/event_model.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <string>

TEST_CASE("EventType maps to stable string values", "[core][events][json]") {
  REQUIRE(loadwatch::events::ToJson(loadwatch::events::EventType::kSchedulerStarted) ==
          "SCHEDULER_STARTED");
  REQUIRE(loadwatch::events::ToJson(loadwatch::events::EventType::kScanFailed) == "SCAN_FAILED");
  REQUIRE(loadwatch::events::ToJson(loadwatch::events::EventType::kLoadDispatched) ==
          "LOAD_DISPATCHED");
  REQUIRE(loadwatch::events::ToJson(loadwatch::events::EventType::kRecoveryEscalated) ==
          "RECOVERY_ESCALATED");
  REQUIRE(loadwatch::events::ToJson(loadwatch::events::EventType::kRetentionSweep) ==
          "RETENTION_SWEEP");
  REQUIRE(loadwatch::events::ToJson(loadwatch::events::EventType::kAlert) == "ALERT");
  REQUIRE(loadwatch::events::ToJson(loadwatch::events::EventType::kInfo) == "info");
  REQUIRE(loadwatch::events::ToJson(loadwatch::events::EventType::kWarning) == "warning");
  REQUIRE(loadwatch::events::ToJson(loadwatch::events::EventType::kError) == "error");
}

TEST_CASE("Event JSON serialization includes timestamp type and payload", "[core][events][json]") {
  loadwatch::events::Event event;
  event.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(2'000));
  event.type = loadwatch::events::EventType::kLoadDispatched;
  event.payload = {
      {"fingerprint", "00a1b2c3d4e5f607"},
      {"external_id", "A1"},
  };

  const std::string json = loadwatch::events::ToJson(event);
  REQUIRE(
      json ==
      R"({"ts_utc":"1970-01-01T00:00:02.000Z","type":"LOAD_DISPATCHED","payload":{"external_id":"A1","fingerprint":"00a1b2c3d4e5f607"}})");
}

TEST_CASE("Event payload values are JSON escaped", "[core][events][json]") {
  loadwatch::events::Event event;
  event.type = loadwatch::events::EventType::kAlert;
  event.payload = {{"message", "pickup \"Dallas\"\nfailed"}};

  const std::string json = loadwatch::events::ToJson(event);
  REQUIRE(json.find(R"("message":"pickup \"Dallas\"\nfailed")") != std::string::npos);
}
