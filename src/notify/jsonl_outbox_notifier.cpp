#include "notify/jsonl_outbox_notifier.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>
#include <utility>

namespace loadwatch::notify {

std::string BuildOutboxJson(const loads::RawLoad& load,
                            const loads::ProfitabilityAnalysis& analysis,
                            const std::chrono::system_clock::time_point queued_at) {
  std::ostringstream out;
  out << "{"
      << "\"queued_at\":" << core::QuoteJson(core::FormatUtcTimestamp(queued_at)) << ","
      << "\"external_id\":" << core::QuoteJson(load.external_id) << ","
      << "\"pickup\":" << core::QuoteJson(load.pickup) << ","
      << "\"delivery\":" << core::QuoteJson(load.delivery) << ","
      << "\"miles\":" << core::FormatJsonNumber(load.miles, 1) << ","
      << "\"deadhead\":" << core::FormatJsonNumber(load.deadhead, 1) << ","
      << "\"rate\":" << core::FormatJsonNumber(analysis.rate, 2) << ","
      << "\"rate_synthesized\":" << (analysis.rate_synthesized ? "true" : "false") << ","
      << "\"rate_per_mile\":" << core::FormatJsonNumber(analysis.rate_per_mile, 2) << ","
      << "\"equipment\":" << core::QuoteJson(load.equipment) << ",";
  if (load.pickup_date.has_value()) {
    out << "\"pickup_date\":" << core::QuoteJson(*load.pickup_date) << ",";
  } else {
    out << "\"pickup_date\":null,";
  }
  out << "\"priority\":" << core::QuoteJson(loads::ToString(analysis.priority)) << ","
      << "\"quality_score\":" << analysis.quality_score << ","
      << "\"profitability_score\":" << core::FormatJsonNumber(analysis.profitability_score, 2)
      << ","
      << "\"net_profit_margin_percent\":"
      << core::FormatJsonNumber(analysis.net_profit_margin_percent, 1) << ","
      << "\"fuel_cost\":" << core::FormatJsonNumber(analysis.fuel_cost, 2) << "}";
  return out.str();
}

JsonlOutboxNotifier::JsonlOutboxNotifier(std::filesystem::path outbox_path, WallClockFn wall_clock)
    : outbox_path_(std::move(outbox_path)), wall_clock_(std::move(wall_clock)) {
  if (!wall_clock_) {
    wall_clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

bool JsonlOutboxNotifier::Notify(const loads::RawLoad& load,
                                 const loads::ProfitabilityAnalysis& analysis,
                                 std::string& error) {
  const std::string line = BuildOutboxJson(load, analysis, wall_clock_());
  std::lock_guard<std::mutex> lock(mu_);
  return core::AppendLine(outbox_path_, line, error);
}

} // namespace loadwatch::notify
