#include "loads/text_parse.hpp"

#include "core/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace loadwatch::loads {

namespace {

constexpr double kMinBareMiles = 10.0;
constexpr double kMaxBareMiles = 3000.0;

bool IsDigit(const char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool IsSpace(const char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

struct NumberToken {
  std::size_t begin = 0;
  std::size_t end = 0;
  std::uint64_t value = 0;
};

std::vector<NumberToken> FindIntegerTokens(const std::string& text) {
  std::vector<NumberToken> tokens;
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (!IsDigit(text[pos])) {
      ++pos;
      continue;
    }
    NumberToken token;
    token.begin = pos;
    while (pos < text.size() && IsDigit(text[pos])) {
      ++pos;
    }
    token.end = pos;
    const auto [ptr, ec] =
        std::from_chars(text.data() + token.begin, text.data() + token.end, token.value);
    if (ec == std::errc() && ptr == text.data() + token.end) {
      tokens.push_back(token);
    }
  }
  return tokens;
}

std::size_t SkipSpaces(const std::string& text, std::size_t pos) {
  while (pos < text.size() && IsSpace(text[pos])) {
    ++pos;
  }
  return pos;
}

bool FollowedBy(const std::string& text, const NumberToken& token, std::string_view word) {
  const std::size_t pos = SkipSpaces(text, token.end);
  return text.compare(pos, word.size(), word) == 0;
}

bool PrecededBy(const std::string& text, const NumberToken& token, std::string_view word) {
  std::size_t pos = token.begin;
  while (pos > 0 && IsSpace(text[pos - 1])) {
    --pos;
  }
  return pos >= word.size() && text.compare(pos - word.size(), word.size(), word) == 0;
}

} // namespace

std::optional<double> ParseRateText(std::string_view text) {
  std::string cleaned;
  cleaned.reserve(text.size());
  for (const char c : text) {
    if (IsDigit(c) || c == '.') {
      cleaned.push_back(c);
    }
  }
  if (cleaned.empty() || std::count(cleaned.begin(), cleaned.end(), '.') > 1) {
    return std::nullopt;
  }

  char* end = nullptr;
  const double value = std::strtod(cleaned.c_str(), &end);
  if (end != cleaned.c_str() + cleaned.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> ParseMilesText(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::string lowered = core::ToLowerAscii(text);
  // Thousands separators: "1,250 mi".
  lowered.erase(std::remove(lowered.begin(), lowered.end(), ','), lowered.end());
  const auto tokens = FindIntegerTokens(lowered);

  for (const auto& token : tokens) {
    // "mi" also covers "mile"/"miles".
    if (FollowedBy(lowered, token, "mi")) {
      return static_cast<double>(token.value);
    }
  }

  if (!tokens.empty()) {
    const auto first = static_cast<double>(tokens.front().value);
    if (first >= kMinBareMiles && first <= kMaxBareMiles) {
      return first;
    }
  }
  return std::nullopt;
}

std::optional<double> ParseDeadheadText(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  const std::string lowered = core::ToLowerAscii(text);
  const auto tokens = FindIntegerTokens(lowered);

  for (const auto& token : tokens) {
    if (FollowedBy(lowered, token, "dh") || FollowedBy(lowered, token, "deadhead") ||
        FollowedBy(lowered, token, "empty")) {
      return static_cast<double>(token.value);
    }
  }
  for (const auto& token : tokens) {
    if (PrecededBy(lowered, token, "dh") || PrecededBy(lowered, token, "deadhead")) {
      return static_cast<double>(token.value);
    }
  }
  return std::nullopt;
}

} // namespace loadwatch::loads
