#ifndef LOADWATCH_CORE_JSON_UTILS_HPP_
#define LOADWATCH_CORE_JSON_UTILS_HPP_

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace loadwatch::core {

// Shared JSON string escaping for event, outbox and status writers. Bytes
// >= 0x80 pass through untouched; scraped UTF-8 stays readable.
inline std::string EscapeJson(std::string_view input) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(input.size() + 8);
  for (const char ch : input) {
    const auto byte = static_cast<unsigned char>(ch);
    switch (ch) {
    case '"':
      out += "\\\"";
      continue;
    case '\\':
      out += "\\\\";
      continue;
    case '\n':
      out += "\\n";
      continue;
    case '\r':
      out += "\\r";
      continue;
    case '\t':
      out += "\\t";
      continue;
    case '\b':
      out += "\\b";
      continue;
    case '\f':
      out += "\\f";
      continue;
    default:
      break;
    }
    if (byte < 0x20U) {
      out += "\\u00";
      out += kHex[byte >> 4U];
      out += kHex[byte & 0x0FU];
    } else {
      out += ch;
    }
  }
  return out;
}

inline std::string QuoteJson(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

// Fixed-precision number rendering. Non-finite values become 0 so emitted
// documents always stay valid JSON.
inline std::string FormatJsonNumber(double value, int precision = 3) {
  if (!std::isfinite(value)) {
    return "0";
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

} // namespace loadwatch::core

#endif // LOADWATCH_CORE_JSON_UTILS_HPP_
