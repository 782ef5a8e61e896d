#include "core/json_dom.hpp"

#include <catch2/catch.hpp>

#include <cstdint>
#include <string>

namespace json = loadwatch::core::json;

TEST_CASE("Parser builds nested objects and decodes escapes", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE(json::Parse(R"({"load": {"pickup": "Dallasé\n", "miles": 412.5, "hazmat": false,
                         "stops": [1, null]}})",
                      root, error));
  REQUIRE(error.empty());

  const json::Value* pickup = json::FindPath(root, {"load", "pickup"});
  REQUIRE(pickup != nullptr);
  REQUIRE(pickup->string_value == "Dallas\xC3\xA9\n");

  const json::Value* miles = json::FindPath(root, {"load", "miles"});
  REQUIRE(miles != nullptr);
  REQUIRE(miles->number_value == 412.5);

  const json::Value* stops = json::FindPath(root, {"load", "stops"});
  REQUIRE(stops != nullptr);
  REQUIRE(stops->IsArray());
  REQUIRE(stops->array_value.size() == 2U);
  REQUIRE(stops->array_value[1].IsNull());

  REQUIRE(json::FindPath(root, {"load", "rate"}) == nullptr);
  REQUIRE(json::FindPath(root, {"load", "pickup", "city"}) == nullptr);
}

TEST_CASE("Parser errors report line and column", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE_FALSE(json::Parse("{\n  \"a\": 1,\n  \"b\" 2\n}", root, error));
  REQUIRE(error.find("line 3") != std::string::npos);
  REQUIRE(error.find("expected ':'") != std::string::npos);
}

TEST_CASE("Parser rejects duplicate keys and runaway nesting", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE_FALSE(json::Parse(R"({"scan_interval_s": 5, "scan_interval_s": 6})", root, error));
  REQUIRE(error.find("duplicate object key 'scan_interval_s'") != std::string::npos);

  const std::string deep(json::Parser::kMaxDepth + 1, '[');
  REQUIRE_FALSE(json::Parse(deep, root, error));
  REQUIRE(error.find("nesting deeper") != std::string::npos);

  REQUIRE_FALSE(json::Parse("[1, 2] x", root, error));
  REQUIRE(error.find("trailing content") != std::string::npos);
  REQUIRE_FALSE(json::Parse("01", root, error));
}

TEST_CASE("TryGetCount accepts only whole non-negative 32-bit values", "[core][json]") {
  json::Value value;
  value.type = json::Value::Type::kNumber;
  std::uint64_t out = 0;

  value.number_value = 7.0;
  REQUIRE(json::TryGetCount(value, out));
  REQUIRE(out == 7U);

  value.number_value = 7.5;
  REQUIRE_FALSE(json::TryGetCount(value, out));
  value.number_value = -1.0;
  REQUIRE_FALSE(json::TryGetCount(value, out));
  value.number_value = 5e9;
  REQUIRE_FALSE(json::TryGetCount(value, out));

  value.type = json::Value::Type::kString;
  value.string_value = "7";
  REQUIRE_FALSE(json::TryGetCount(value, out));
}
