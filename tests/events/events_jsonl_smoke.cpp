#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "events/event_model.hpp"
#include "events/jsonl_writer.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main() {
  using loadwatch::events::AppendEventJsonl;
  using loadwatch::events::Event;
  using loadwatch::events::EventType;
  using loadwatch::tests::common::AssertContains;
  using loadwatch::tests::common::Fail;

  const loadwatch::tests::common::ScopedTempDir scratch("loadwatch-events-jsonl");
  const fs::path& temp_root = scratch.path();
  // Parent directories are created on first append.
  const fs::path events_path = temp_root / "nested" / "events.jsonl";

  Event first;
  first.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'000));
  first.type = EventType::kSchedulerStarted;
  first.payload = {
      {"cycles", "0"},
  };

  Event second;
  second.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(2'500));
  second.type = EventType::kScanFailed;
  second.payload = {
      {"cycle", "4"},
      {"error", "upstream said \"no\"\nretry later"},
      {"error_code", "UPSTREAM_TIMEOUT"},
  };

  std::string error;
  if (!AppendEventJsonl(first, events_path, error) ||
      !AppendEventJsonl(second, events_path, error)) {
    Fail("append failed: " + error);
  }

  std::ifstream input(events_path, std::ios::binary);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  if (lines.size() != 2U) {
    Fail("expected exactly two JSONL lines");
  }

  if (lines[0] != R"({"ts_utc":"1970-01-01T00:00:01.000Z","type":"SCHEDULER_STARTED","payload":{"cycles":"0"}})") {
    Fail("unexpected first line: " + lines[0]);
  }
  AssertContains(lines[1], "\"ts_utc\":\"1970-01-01T00:00:02.500Z\"");
  AssertContains(lines[1], "\"type\":\"SCAN_FAILED\"");
  // Quotes and newlines in payload values are escaped so each event stays on one line.
  AssertContains(lines[1], R"("error":"upstream said \"no\"\nretry later")");

  return 0;
}
