#pragma once

#include "loads/raw_load.hpp"

#include <string>
#include <vector>

namespace loadwatch::dispatch {

// Business filter applied before scoring.
struct SearchCriteria {
  // Compared against miles + deadhead.
  double min_total_miles = 200.0;
  double max_deadhead_miles = 250.0;
  // Case-insensitive substrings matched against pickup and delivery text.
  std::vector<std::string> excluded_regions;
};

enum class FilterVerdict {
  kAccepted,
  kTooShort,
  kDeadheadTooLong,
  kExcludedRegion,
};

const char* ToString(FilterVerdict verdict);

FilterVerdict ApplyCriteria(const loads::RawLoad& load, const SearchCriteria& criteria);

inline bool MeetsCriteria(const loads::RawLoad& load, const SearchCriteria& criteria) {
  return ApplyCriteria(load, criteria) == FilterVerdict::kAccepted;
}

} // namespace loadwatch::dispatch
