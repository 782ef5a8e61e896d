#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loadwatch::loads {

// One load record as surfaced by the upstream collaborator. Immutable once
// captured; scoped to the scan cycle that fetched it.
struct RawLoad {
  std::string external_id;
  std::string pickup;
  std::string delivery;
  double miles = 0.0;
  double deadhead = 0.0;
  std::optional<double> rate;
  std::string equipment;
  std::optional<std::string> pickup_date;
  std::chrono::system_clock::time_point captured_at{};
};

using LoadBatch = std::vector<RawLoad>;

enum class PriorityTier {
  kLow,
  kMedium,
  kHigh,
};

const char* ToString(PriorityTier tier);
bool ParsePriorityTier(std::string_view text, PriorityTier& tier);

// Derived economics for one RawLoad. Recomputed on demand, never stored on its
// own.
struct ProfitabilityAnalysis {
  double total_miles = 0.0;
  // Quoted rate, or the synthesized minimum acceptable rate when none was quoted.
  double rate = 0.0;
  bool rate_synthesized = false;
  double rate_per_mile = 0.0;
  double deadhead_ratio = 0.0;
  double fuel_cost = 0.0;
  double gross_profit = 0.0;
  double net_profit_margin_percent = 0.0;
  double profit_margin = 0.0;
  int quality_score = 0;
  PriorityTier priority = PriorityTier::kLow;
  double profitability_score = 0.0;
  bool is_profitable = false;
};

} // namespace loadwatch::loads
