#include "../common/assertions.hpp"
#include "../common/fakes.hpp"
#include "../common/temp_dir.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "events/emitter.hpp"
#include "loads/profitability.hpp"
#include "notify/jsonl_alert_sink.hpp"
#include "notify/jsonl_outbox_notifier.hpp"

#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

int main() {
  using loadwatch::notify::AlertSeverity;
  using loadwatch::tests::common::AssertContains;
  using loadwatch::tests::common::AssertTrue;
  using loadwatch::tests::common::CountOccurrences;
  using loadwatch::tests::common::Fail;
  using loadwatch::tests::common::ReadFileToString;

  const loadwatch::tests::common::ScopedTempDir scratch("loadwatch-notify");
  const fs::path& temp_root = scratch.path();
  std::string error;

  // Outbox lines are one self-contained JSON object per notified load.
  {
    const auto queued_at = std::chrono::system_clock::time_point(std::chrono::seconds(90));
    loadwatch::notify::JsonlOutboxNotifier notifier(temp_root / "outbox.jsonl",
                                                    [queued_at] { return queued_at; });
    auto load = loadwatch::tests::common::MakeLoad("OB-1", "Dallas, \"TX\"", "Atlanta, GA", 300.0,
                                                   20.0, 720.0);
    load.pickup_date = "10/21";
    const auto analysis = loadwatch::loads::Evaluate(load);
    AssertTrue(notifier.Notify(load, analysis, error), "notify should append");
    AssertTrue(notifier.Notify(load, analysis, error), "second notify should append");

    const std::string outbox = ReadFileToString(temp_root / "outbox.jsonl");
    AssertTrue(CountOccurrences(outbox, "\n") == 2U, "one line per notification");
    const std::string first_line = outbox.substr(0, outbox.find('\n'));

    loadwatch::core::json::Value root;
    if (!loadwatch::core::json::Parse(first_line, root, error)) {
      Fail("outbox line is not valid JSON: " + error);
    }
    const auto* pickup = root.Find("pickup");
    AssertTrue(pickup != nullptr && pickup->IsString() && pickup->string_value == "Dallas, \"TX\"",
               "pickup survives escaping");
    AssertContains(first_line, "\"queued_at\":\"1970-01-01T00:01:30.000Z\"");
    AssertContains(first_line, "\"rate_per_mile\":2.25");
    AssertContains(first_line, "\"priority\":\"HIGH\"");
    AssertContains(first_line, "\"pickup_date\":\"10/21\"");
    AssertContains(first_line, "\"rate_synthesized\":false");
  }

  // Alert sink: log line, alerts file and event timeline.
  {
    std::ostringstream log_out;
    loadwatch::core::logging::Logger logger(loadwatch::core::logging::LogLevel::kInfo, log_out);
    loadwatch::events::Emitter emitter(temp_root / "events.jsonl");
    loadwatch::notify::JsonlAlertSink sink(temp_root / "alerts.jsonl", logger, &emitter);

    AssertTrue(sink.RaiseAlert(AlertSeverity::kWarning, "Health DEGRADED", error),
               "warning alert");
    AssertTrue(sink.RaiseAlert(AlertSeverity::kFatal, "Recovery exhausted", error),
               "fatal alert");

    const std::string alerts = ReadFileToString(temp_root / "alerts.jsonl");
    AssertContains(alerts, "\"severity\":\"warning\",\"message\":\"Health DEGRADED\"");
    AssertContains(alerts, "\"severity\":\"fatal\",\"message\":\"Recovery exhausted\"");
    const std::string events = ReadFileToString(temp_root / "events.jsonl");
    AssertTrue(CountOccurrences(events, "\"type\":\"ALERT\"") == 2U, "alerts mirrored as events");
    AssertContains(log_out.str(), "level=WARN");
    AssertContains(log_out.str(), "level=ERROR");
    AssertContains(log_out.str(), "message=\"Recovery exhausted\"");

    AlertSeverity parsed = AlertSeverity::kInfo;
    AssertTrue(loadwatch::notify::ParseAlertSeverity("critical", parsed) &&
                   parsed == AlertSeverity::kCritical,
               "severity parses");
    AssertTrue(!loadwatch::notify::ParseAlertSeverity("CRITICAL", parsed),
               "severity names are lowercase");
  }

  // Without a file or emitter the sink only logs.
  {
    std::ostringstream log_out;
    loadwatch::core::logging::Logger logger(loadwatch::core::logging::LogLevel::kInfo, log_out);
    loadwatch::notify::JsonlAlertSink sink(fs::path{}, logger);
    AssertTrue(sink.RaiseAlert(AlertSeverity::kInfo, "System recovered", error), "info alert");
    AssertContains(log_out.str(), "System recovered");
  }

  return 0;
}
