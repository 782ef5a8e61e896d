#pragma once

#include "loads/raw_load.hpp"

#include <string>
#include <vector>

namespace loadwatch::loads {

// Cost and threshold inputs for profitability scoring. Defaults match the
// dispatch desk's standing rules of thumb.
struct EstimatorConfig {
  // Used to synthesize a minimum acceptable rate when no rate is quoted.
  double base_rate_per_mile = 1.7;
  // Floor for is_profitable and the divisor of profitability_score.
  double min_rate_per_mile = 1.5;
  double mpg = 6.5;
  double fuel_price = 4.0;
  std::vector<std::string> preferred_equipment = {"van", "reefer", "flatbed"};
};

// Quality score bonus breakpoints.
constexpr double kPremiumRatePerMile = 2.0;
constexpr double kStrongRatePerMile = 1.8;
constexpr double kFairRatePerMile = 1.5;
constexpr double kLowDeadheadRatio = 0.1;
constexpr double kModerateDeadheadRatio = 0.2;
constexpr double kLongHaulMiles = 500.0;
constexpr double kMidHaulMiles = 200.0;

constexpr int kHighPriorityMinQuality = 5;
constexpr int kMediumPriorityMinQuality = 3;
constexpr int kProfitableMinQuality = 3;

// Pure function from a load to its profitability analysis. Total for any
// input: a zero-mile load yields zero ratios and is never profitable.
ProfitabilityAnalysis Evaluate(const RawLoad& load, const EstimatorConfig& config = {});

// Minimum acceptable rate: (miles + deadhead) * base_rate_per_mile.
double MinimumAcceptableRate(double miles, double deadhead, double base_rate_per_mile);

double EstimateFuelCost(double total_miles, double mpg, double fuel_price);

PriorityTier DeterminePriority(int quality_score, double rate_per_mile);

} // namespace loadwatch::loads
