#ifndef LOADWATCH_CORE_STRING_UTILS_HPP_
#define LOADWATCH_CORE_STRING_UTILS_HPP_

#include <string>
#include <string_view>

namespace loadwatch::core {

// ASCII-only case folding for matching scraped board text, config enums and
// upstream error details. Bytes >= 0x80 are left alone.
inline std::string ToLowerAscii(std::string_view value) {
  std::string lowered(value);
  for (char& c : lowered) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return lowered;
}

} // namespace loadwatch::core

#endif // LOADWATCH_CORE_STRING_UTILS_HPP_
