#include "loads/profitability.hpp"

#include "core/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace loadwatch::loads {

namespace {

bool MatchesPreferredEquipment(std::string_view equipment,
                               const std::vector<std::string>& preferred) {
  if (equipment.empty()) {
    return false;
  }
  const std::string lowered = core::ToLowerAscii(equipment);
  return std::any_of(preferred.begin(), preferred.end(), [&](const std::string& candidate) {
    return !candidate.empty() && lowered.find(core::ToLowerAscii(candidate)) != std::string::npos;
  });
}

int ComputeQualityScore(const RawLoad& load, const double rate_per_mile,
                        const double deadhead_ratio, const EstimatorConfig& config) {
  int score = 0;

  if (rate_per_mile >= kPremiumRatePerMile) {
    score += 3;
  } else if (rate_per_mile >= kStrongRatePerMile) {
    score += 2;
  } else if (rate_per_mile >= kFairRatePerMile) {
    score += 1;
  }

  if (deadhead_ratio <= kLowDeadheadRatio) {
    score += 2;
  } else if (deadhead_ratio <= kModerateDeadheadRatio) {
    score += 1;
  }

  // Trip length counts loaded miles only.
  if (load.miles >= kLongHaulMiles || load.miles >= kMidHaulMiles) {
    score += 1;
  }

  if (MatchesPreferredEquipment(load.equipment, config.preferred_equipment)) {
    score += 1;
  }

  if (load.pickup_date.has_value() && !load.pickup_date->empty()) {
    score += 1;
  }

  return score;
}

} // namespace

const char* ToString(const PriorityTier tier) {
  switch (tier) {
  case PriorityTier::kHigh:
    return "HIGH";
  case PriorityTier::kMedium:
    return "MEDIUM";
  case PriorityTier::kLow:
    return "LOW";
  }
  return "LOW";
}

bool ParsePriorityTier(std::string_view text, PriorityTier& tier) {
  if (text == "HIGH") {
    tier = PriorityTier::kHigh;
    return true;
  }
  if (text == "MEDIUM") {
    tier = PriorityTier::kMedium;
    return true;
  }
  if (text == "LOW") {
    tier = PriorityTier::kLow;
    return true;
  }
  return false;
}

double MinimumAcceptableRate(const double miles, const double deadhead,
                             const double base_rate_per_mile) {
  return (miles + deadhead) * base_rate_per_mile;
}

double EstimateFuelCost(const double total_miles, const double mpg, const double fuel_price) {
  if (mpg <= 0.0) {
    return 0.0;
  }
  return (total_miles / mpg) * fuel_price;
}

PriorityTier DeterminePriority(const int quality_score, const double rate_per_mile) {
  if (quality_score >= kHighPriorityMinQuality && rate_per_mile >= kPremiumRatePerMile) {
    return PriorityTier::kHigh;
  }
  if (quality_score >= kMediumPriorityMinQuality && rate_per_mile >= kFairRatePerMile) {
    return PriorityTier::kMedium;
  }
  return PriorityTier::kLow;
}

ProfitabilityAnalysis Evaluate(const RawLoad& load, const EstimatorConfig& config) {
  ProfitabilityAnalysis analysis;
  analysis.total_miles = load.miles + load.deadhead;

  if (load.rate.has_value()) {
    analysis.rate = load.rate.value();
  } else {
    analysis.rate = MinimumAcceptableRate(load.miles, load.deadhead, config.base_rate_per_mile);
    analysis.rate_synthesized = true;
  }

  const bool has_distance = analysis.total_miles > 0.0;
  if (has_distance) {
    analysis.rate_per_mile = analysis.rate / analysis.total_miles;
    analysis.deadhead_ratio = load.deadhead / analysis.total_miles;
  }

  analysis.fuel_cost = EstimateFuelCost(analysis.total_miles, config.mpg, config.fuel_price);
  analysis.gross_profit = analysis.rate - analysis.fuel_cost;
  if (analysis.rate > 0.0) {
    analysis.net_profit_margin_percent = (analysis.gross_profit / analysis.rate) * 100.0;
  }
  if (has_distance) {
    analysis.profit_margin =
        (analysis.rate_per_mile - config.base_rate_per_mile) * analysis.total_miles;
  }

  analysis.quality_score =
      ComputeQualityScore(load, analysis.rate_per_mile, analysis.deadhead_ratio, config);
  analysis.priority = DeterminePriority(analysis.quality_score, analysis.rate_per_mile);

  if (analysis.rate_per_mile > 0.0 && config.min_rate_per_mile > 0.0) {
    analysis.profitability_score = analysis.rate_per_mile / config.min_rate_per_mile;
  }

  analysis.is_profitable = has_distance &&
                           analysis.rate_per_mile >= config.min_rate_per_mile &&
                           analysis.quality_score >= kProfitableMinQuality;
  return analysis;
}

} // namespace loadwatch::loads
