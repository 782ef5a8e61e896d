#ifndef LOADWATCH_CORE_JSON_DOM_HPP_
#define LOADWATCH_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace loadwatch::core::json {

// Minimal DOM shared by config loading, the replay upstream fixtures and the
// sent-record store reload path.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  bool IsObject() const {
    return type == Type::kObject;
  }
  bool IsArray() const {
    return type == Type::kArray;
  }
  bool IsString() const {
    return type == Type::kString;
  }
  bool IsNumber() const {
    return type == Type::kNumber;
  }
  bool IsBool() const {
    return type == Type::kBool;
  }
  bool IsNull() const {
    return type == Type::kNull;
  }

  // Returns the member for `key`, or nullptr when absent or not an object.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
  }
};

// Walks nested objects, e.g. {"recovery", "max_attempts"}. Returns nullptr when
// any hop is missing.
inline const Value* FindPath(const Value& root, std::initializer_list<std::string_view> path) {
  const Value* cursor = &root;
  for (const std::string_view key : path) {
    cursor = cursor->Find(key);
    if (cursor == nullptr) {
      return nullptr;
    }
  }
  return cursor;
}

// Counts (attempts, cycles, fault knobs, retention days) must be whole,
// non-negative and fit in 32 bits.
inline bool TryGetCount(const Value& value, std::uint64_t& out) {
  if (!value.IsNumber() || !std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value ||
      floored > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

// Recursive-descent JSON parser. Errors carry line/column so a broken config
// or fixture points at the offending character. Duplicate object keys are
// rejected: a config that names `scan_interval_s` twice is ambiguous.
class Parser {
public:
  static constexpr int kMaxDepth = 64;

  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, 0, error)) {
      return false;
    }
    SkipWhitespace();
    if (pos_ < input_.size()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, int depth, std::string& error) {
    if (pos_ >= input_.size()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    value = Value{};
    switch (input_[pos_]) {
    case '{':
    case '[':
      if (depth >= kMaxDepth) {
        return Fail("nesting deeper than " + std::to_string(kMaxDepth) + " levels", error);
      }
      return input_[pos_] == '{' ? ParseObject(value, depth + 1, error)
                                 : ParseArray(value, depth + 1, error);
    case '"':
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    case '-':
    case '0':
    case '1':
    case '2':
    case '3':
    case '4':
    case '5':
    case '6':
    case '7':
    case '8':
    case '9':
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    default:
      break;
    }

    struct Literal {
      std::string_view text;
      Value::Type type;
      bool flag;
    };
    static constexpr Literal kLiterals[] = {
        {"true", Value::Type::kBool, true},
        {"false", Value::Type::kBool, false},
        {"null", Value::Type::kNull, false},
    };
    for (const auto& literal : kLiterals) {
      if (input_.substr(pos_, literal.text.size()) == literal.text) {
        value.type = literal.type;
        value.bool_value = literal.flag;
        Skip(literal.text.size());
        return true;
      }
    }
    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, int depth, std::string& error) {
    value.type = Value::Type::kObject;
    Skip(1);
    SkipWhitespace();
    if (TryConsume('}')) {
      return true;
    }

    for (;;) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }
      if (value.object_value.count(key) != 0U) {
        return Fail("duplicate object key '" + key + "'", error);
      }
      SkipWhitespace();
      if (!Expect(':', "expected ':' after object key", error)) {
        return false;
      }
      SkipWhitespace();
      if (!ParseValue(value.object_value[key], depth, error)) {
        return false;
      }
      SkipWhitespace();
      if (TryConsume('}')) {
        return true;
      }
      if (!Expect(',', "expected ',' between object entries", error)) {
        return false;
      }
    }
  }

  bool ParseArray(Value& value, int depth, std::string& error) {
    value.type = Value::Type::kArray;
    Skip(1);
    SkipWhitespace();
    if (TryConsume(']')) {
      return true;
    }

    for (;;) {
      SkipWhitespace();
      value.array_value.emplace_back();
      if (!ParseValue(value.array_value.back(), depth, error)) {
        return false;
      }
      SkipWhitespace();
      if (TryConsume(']')) {
        return true;
      }
      if (!Expect(',', "expected ',' between array items", error)) {
        return false;
      }
    }
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!Expect('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (pos_ < input_.size()) {
      const char c = Next();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      if (c != '\\') {
        output.push_back(c);
        continue;
      }

      if (pos_ >= input_.size()) {
        break;
      }
      const char esc = Next();
      if (esc == 'u') {
        if (!ParseUnicodeEscape(output, error)) {
          return false;
        }
        continue;
      }
      const char decoded = DecodeSimpleEscape(esc);
      if (decoded == '\0') {
        return Fail("invalid escape sequence in string", error);
      }
      output.push_back(decoded);
    }

    return Fail("unterminated string literal", error);
  }

  static char DecodeSimpleEscape(char esc) {
    switch (esc) {
    case '"':
    case '\\':
    case '/':
      return esc;
    case 'b':
      return '\b';
    case 'f':
      return '\f';
    case 'n':
      return '\n';
    case 'r':
      return '\r';
    case 't':
      return '\t';
    default:
      return '\0';
    }
  }

  // Validates the RFC 8259 number grammar, then hands the token to strtod.
  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;
    TryConsume('-');
    if (!TryConsume('0') && SkipDigits() == 0U) {
      return Fail("expected digits in number", error);
    }
    if (TryConsume('.') && SkipDigits() == 0U) {
      return Fail("expected digits after decimal point", error);
    }
    if (TryConsume('e') || TryConsume('E')) {
      if (!TryConsume('+')) {
        TryConsume('-');
      }
      if (SkipDigits() == 0U) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string token(input_.substr(start, pos_ - start));
    char* end = nullptr;
    errno = 0;
    output = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size()) {
      return Fail("invalid number token", error);
    }
    if (errno == ERANGE && std::isinf(output)) {
      return Fail("numeric value out of range", error);
    }
    return true;
  }

  // Decodes one \uXXXX escape (BMP only) to UTF-8. Surrogate pairs are
  // rejected; load boards do not send them.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    if (input_.size() - pos_ < 4U) {
      return Fail("truncated unicode escape", error);
    }
    std::uint32_t code_point = 0;
    for (int i = 0; i < 4; ++i) {
      const char hex = Next();
      int nibble = -1;
      if (hex >= '0' && hex <= '9') {
        nibble = hex - '0';
      } else if (hex >= 'a' && hex <= 'f') {
        nibble = hex - 'a' + 10;
      } else if (hex >= 'A' && hex <= 'F') {
        nibble = hex - 'A' + 10;
      }
      if (nibble < 0) {
        return Fail("invalid hex digit in unicode escape", error);
      }
      code_point = (code_point << 4U) | static_cast<std::uint32_t>(nibble);
    }
    if (code_point >= 0xD800U && code_point <= 0xDFFFU) {
      return Fail("surrogate unicode escapes are not supported", error);
    }

    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
      return true;
    }
    if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
    } else {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
    }
    output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    return true;
  }

  void SkipWhitespace() {
    while (pos_ < input_.size()) {
      const char c = input_[pos_];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
        return;
      }
      Next();
    }
  }

  std::size_t SkipDigits() {
    std::size_t count = 0;
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
      Next();
      ++count;
    }
    return count;
  }

  bool TryConsume(char expected) {
    if (pos_ < input_.size() && input_[pos_] == expected) {
      Next();
      return true;
    }
    return false;
  }

  bool Expect(char expected, std::string_view message, std::string& error) {
    return TryConsume(expected) || Fail(message, error);
  }

  void Skip(std::size_t n) {
    while (n-- > 0U && pos_ < input_.size()) {
      Next();
    }
  }

  char Next() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

} // namespace loadwatch::core::json

#endif // LOADWATCH_CORE_JSON_DOM_HPP_
