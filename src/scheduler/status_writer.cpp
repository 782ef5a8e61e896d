#include "scheduler/status_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace loadwatch::scheduler {

namespace {

const char* BoolText(const bool value) {
  return value ? "true" : "false";
}

void AppendDispatchSummary(std::ostringstream& out, const dispatch::DispatchSummary& summary) {
  out << "{\n"
      << "      \"attempted\": " << summary.attempted << ",\n"
      << "      \"sent\": " << summary.sent << ",\n"
      << "      \"filtered_out\": " << summary.filtered_out << ",\n"
      << "      \"unprofitable\": " << summary.unprofitable << ",\n"
      << "      \"duplicates\": " << summary.duplicates << ",\n"
      << "      \"failed\": " << summary.failed << ",\n"
      << "      \"persist_failures\": " << summary.persist_failures << ",\n"
      << "      \"abandoned\": " << summary.abandoned << ",\n"
      << "      \"peak_in_flight\": " << summary.peak_in_flight << "\n"
      << "    }";
}

} // namespace

std::string BuildStatusJson(const StatusSnapshot& snapshot) {
  const MonitoringStats& stats = snapshot.stats;
  const adaptive::HealthMetrics& metrics = snapshot.adaptation.metrics;
  const adaptive::ScanStrategy& strategy = snapshot.adaptation.strategy;
  const metrics::ScanTimingReport& timing = snapshot.scan_timing;

  std::ostringstream out;
  out << "{\n"
      << "  \"instance_id\": " << core::QuoteJson(snapshot.instance_id) << ",\n"
      << "  \"updated_at_utc\": " << core::QuoteJson(core::FormatUtcTimestamp(snapshot.updated_at))
      << ",\n"
      << "  \"state\": " << core::QuoteJson(snapshot.state) << ",\n";

  out << "  \"stats\": {\n"
      << "    \"started_at_utc\": " << core::QuoteJson(core::FormatUtcTimestamp(stats.started_at))
      << ",\n"
      << "    \"uptime_s\": " << core::FormatJsonNumber(stats.uptime_s, 1) << ",\n"
      << "    \"scan_count\": " << stats.scan_count << ",\n"
      << "    \"failed_scans\": " << stats.failed_scans << ",\n"
      << "    \"loads_found_total\": " << stats.loads_found_total << ",\n"
      << "    \"loads_sent_total\": " << stats.loads_sent_total << ",\n"
      << "    \"dispatch_failures\": " << stats.dispatch_failures << ",\n"
      << "    \"persist_failures\": " << stats.persist_failures << ",\n"
      << "    \"abandoned_total\": " << stats.abandoned_total << ",\n"
      << "    \"recoveries_started\": " << stats.recoveries_started << ",\n"
      << "    \"recoveries_succeeded\": " << stats.recoveries_succeeded << ",\n"
      << "    \"retention_removed_total\": " << stats.retention_removed_total << ",\n"
      << "    \"last_dispatch\": ";
  AppendDispatchSummary(out, stats.last_dispatch);
  out << "\n  },\n";

  out << "  \"adaptation\": {\n"
      << "    \"level\": " << core::QuoteJson(adaptive::ToString(snapshot.adaptation.level))
      << ",\n"
      << "    \"success_rate\": " << core::FormatJsonNumber(metrics.success_rate) << ",\n"
      << "    \"avg_response_time_s\": " << core::FormatJsonNumber(metrics.avg_response_time_s)
      << ",\n"
      << "    \"error_count\": " << core::FormatJsonNumber(metrics.error_count, 1) << ",\n"
      << "    \"consecutive_empty_scans\": " << metrics.consecutive_empty_scans << ",\n"
      << "    \"last_loads_found\": " << metrics.last_loads_found << ",\n"
      << "    \"samples\": " << metrics.samples << ",\n"
      << "    \"recovery_recommended\": " << BoolText(snapshot.adaptation.recovery_recommended)
      << "\n  },\n";

  out << "  \"strategy\": {\n"
      << "    \"interval_s\": " << core::FormatJsonNumber(strategy.interval_s, 1) << ",\n"
      << "    \"concurrent_requests\": " << strategy.concurrent_requests << ",\n"
      << "    \"timeout_s\": " << core::FormatJsonNumber(strategy.timeout_s, 1) << ",\n"
      << "    \"diagnostics_on_error\": " << BoolText(strategy.diagnostics_on_error) << ",\n"
      << "    \"max_retries\": " << strategy.max_retries << ",\n"
      << "    \"fast_path_transport\": " << BoolText(strategy.fast_path_transport) << "\n"
      << "  },\n";

  out << "  \"recovery\": {\n"
      << "    \"state\": " << core::QuoteJson(recovery::ToString(snapshot.recovery.state)) << ",\n"
      << "    \"attempts\": " << snapshot.recovery.attempts << ",\n"
      << "    \"recoveries_succeeded\": " << snapshot.recovery.recoveries_succeeded << ",\n"
      << "    \"backoff_history_s\": [";
  for (std::size_t i = 0; i < snapshot.recovery.backoff_history_s.size(); ++i) {
    if (i > 0U) {
      out << ", ";
    }
    out << core::FormatJsonNumber(snapshot.recovery.backoff_history_s[i], 1);
  }
  out << "]\n  },\n";

  out << "  \"scan_timing\": {\n"
      << "    \"total_scans\": " << timing.total_scans << ",\n"
      << "    \"avg_ms\": " << core::FormatJsonNumber(timing.avg_ms, 1) << ",\n"
      << "    \"min_ms\": " << core::FormatJsonNumber(timing.min_ms, 1) << ",\n"
      << "    \"max_ms\": " << core::FormatJsonNumber(timing.max_ms, 1) << ",\n"
      << "    \"recent_avg_ms\": " << core::FormatJsonNumber(timing.recent_avg_ms, 1) << ",\n"
      << "    \"performance_score\": " << core::FormatJsonNumber(timing.performance_score, 1)
      << ",\n"
      << "    \"scale_down_recommended\": " << BoolText(timing.scale_down_recommended) << ",\n"
      << "    \"recommendations\": [";
  for (std::size_t i = 0; i < timing.recommendations.size(); ++i) {
    if (i > 0U) {
      out << ", ";
    }
    out << core::QuoteJson(timing.recommendations[i]);
  }
  out << "]\n  }\n}\n";
  return out.str();
}

bool WriteStatusJson(const StatusSnapshot& snapshot, const std::filesystem::path& output_path,
                     std::string& error) {
  return core::WriteTextFileAtomic(output_path, BuildStatusJson(snapshot), error);
}

} // namespace loadwatch::scheduler
