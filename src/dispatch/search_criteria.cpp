#include "dispatch/search_criteria.hpp"

#include "core/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace loadwatch::dispatch {

const char* ToString(const FilterVerdict verdict) {
  switch (verdict) {
  case FilterVerdict::kAccepted:
    return "accepted";
  case FilterVerdict::kTooShort:
    return "too_short";
  case FilterVerdict::kDeadheadTooLong:
    return "deadhead_too_long";
  case FilterVerdict::kExcludedRegion:
    return "excluded_region";
  }
  return "accepted";
}

FilterVerdict ApplyCriteria(const loads::RawLoad& load, const SearchCriteria& criteria) {
  if (load.miles + load.deadhead < criteria.min_total_miles) {
    return FilterVerdict::kTooShort;
  }
  if (load.deadhead > criteria.max_deadhead_miles) {
    return FilterVerdict::kDeadheadTooLong;
  }

  if (!criteria.excluded_regions.empty()) {
    const std::string pickup = core::ToLowerAscii(load.pickup);
    const std::string delivery = core::ToLowerAscii(load.delivery);
    for (const std::string& region : criteria.excluded_regions) {
      if (region.empty()) {
        continue;
      }
      const std::string token = core::ToLowerAscii(region);
      if (pickup.find(token) != std::string::npos || delivery.find(token) != std::string::npos) {
        return FilterVerdict::kExcludedRegion;
      }
    }
  }
  return FilterVerdict::kAccepted;
}

} // namespace loadwatch::dispatch
