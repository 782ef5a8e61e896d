#pragma once

#include <optional>
#include <string_view>

namespace loadwatch::loads {

// Helpers that turn scraped display text into numbers. They never throw and
// return nullopt when the text carries no usable value.

// "$1,250.00" -> 1250.0. Strips everything except digits and '.'.
std::optional<double> ParseRateText(std::string_view text);

// "450 mi" / "450 miles" -> 450. Bare numbers count only inside 10..3000.
std::optional<double> ParseMilesText(std::string_view text);

// "35 DH", "DH 35", "35 Deadhead", "35 Empty" -> 35.
std::optional<double> ParseDeadheadText(std::string_view text);

} // namespace loadwatch::loads
