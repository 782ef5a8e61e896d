#include "../common/assertions.hpp"
#include "../common/fakes.hpp"
#include "dispatch/search_criteria.hpp"

int main() {
  using loadwatch::dispatch::ApplyCriteria;
  using loadwatch::dispatch::FilterVerdict;
  using loadwatch::dispatch::MeetsCriteria;
  using loadwatch::dispatch::SearchCriteria;
  using loadwatch::tests::common::AssertTrue;
  using loadwatch::tests::common::MakeLoad;

  SearchCriteria criteria;
  criteria.excluded_regions = {"Brooklyn", "nj"};

  // Total distance counts deadhead.
  AssertTrue(ApplyCriteria(MakeLoad("a", "Akron, OH", "Erie, PA", 180.0, 20.0, 500.0), criteria) ==
                 FilterVerdict::kAccepted,
             "200 total miles meets the minimum");
  AssertTrue(ApplyCriteria(MakeLoad("b", "Akron, OH", "Erie, PA", 150.0, 40.0, 500.0), criteria) ==
                 FilterVerdict::kTooShort,
             "190 total miles is too short");
  AssertTrue(ApplyCriteria(MakeLoad("c", "Akron, OH", "Erie, PA", 900.0, 251.0, 500.0),
                           criteria) == FilterVerdict::kDeadheadTooLong,
             "deadhead above the maximum");
  AssertTrue(ApplyCriteria(MakeLoad("d", "Akron, OH", "Erie, PA", 900.0, 250.0, 500.0),
                           criteria) == FilterVerdict::kAccepted,
             "deadhead at the maximum is allowed");

  // Region tokens match case-insensitively as substrings of either end.
  AssertTrue(ApplyCriteria(MakeLoad("e", "BROOKLYN, NY", "Erie, PA", 400.0, 10.0, 900.0),
                           criteria) == FilterVerdict::kExcludedRegion,
             "excluded pickup region");
  AssertTrue(ApplyCriteria(MakeLoad("f", "Erie, PA", "Newark, NJ", 400.0, 10.0, 900.0),
                           criteria) == FilterVerdict::kExcludedRegion,
             "excluded delivery region");
  AssertTrue(MeetsCriteria(MakeLoad("g", "Erie, PA", "Akron, OH", 400.0, 10.0, 900.0), criteria),
             "clean load meets criteria");

  SearchCriteria with_blank;
  with_blank.excluded_regions = {""};
  AssertTrue(MeetsCriteria(MakeLoad("h", "Erie, PA", "Akron, OH", 400.0, 10.0, 900.0), with_blank),
             "blank region token must not exclude everything");

  AssertTrue(std::string(loadwatch::dispatch::ToString(FilterVerdict::kDeadheadTooLong)) ==
                 "deadhead_too_long",
             "verdict names are stable");
  return 0;
}
