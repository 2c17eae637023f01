#ifndef RECONKIT_CORE_JSON_DOM_HPP_
#define RECONKIT_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace reconkit::core::json {

// Small DOM shared by the platform catalog loader and the geolocation
// response parser.
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

  bool is_object() const {
    return type == Type::kObject;
  }
  bool is_array() const {
    return type == Type::kArray;
  }
  bool is_string() const {
    return type == Type::kString;
  }
  bool is_number() const {
    return type == Type::kNumber;
  }
};

// Returns the member named `key`, or nullptr when `object` is not an object or
// has no such member.
inline const Value* FindField(const Value& object, std::string_view key) {
  if (!object.is_object()) {
    return nullptr;
  }
  const auto it = object.object_value.find(std::string(key));
  if (it == object.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

// String member lookup with a fallback for missing or non-string members.
inline std::string GetStringOr(const Value& object, std::string_view key,
                               std::string_view fallback) {
  const Value* field = FindField(object, key);
  if (field == nullptr || !field->is_string()) {
    return std::string(fallback);
  }
  return field->string_value;
}

// Recursive-descent parser. Errors carry line/column so a hand-edited catalog
// file points at the offending token.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, error);
    }
    if (c == '[') {
      return ParseArray(value, error);
    }
    if (c == '"') {
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (StartsWith("true")) {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      AdvanceN(4);
      return true;
    }
    if (StartsWith("false")) {
      value.type = Value::Type::kBool;
      value.bool_value = false;
      AdvanceN(5);
      return true;
    }
    if (StartsWith("null")) {
      value.type = Value::Type::kNull;
      AdvanceN(4);
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kObject;

    if (!ConsumeChar('{', "expected '{' to start object", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }

      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }

      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.object_value[key] = std::move(item);

      SkipWhitespace();
      if (Match('}')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseArray(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kArray;

    if (!ConsumeChar('[', "expected '[' to start array", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c == '\\') {
        if (AtEnd()) {
          return Fail("unterminated escape sequence in string", error);
        }
        const char esc = Advance();
        switch (esc) {
        case '"':
        case '\\':
        case '/':
          output.push_back(esc);
          break;
        case 'b':
          output.push_back('\b');
          break;
        case 'f':
          output.push_back('\f');
          break;
        case 'n':
          output.push_back('\n');
          break;
        case 'r':
          output.push_back('\r');
          break;
        case 't':
          output.push_back('\t');
          break;
        case 'u':
          if (!ParseUnicodeEscape(output, error)) {
            return false;
          }
          break;
        default:
          return Fail("invalid escape sequence in string", error);
        }
        continue;
      }

      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      output.push_back(c);
    }

    return Fail("unterminated string literal", error);
  }

  // Decodes `XXXX` (after `\u`) and an optional trailing low surrogate into
  // UTF-8. Geolocation responses escape non-ASCII city and ISP names this way.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t code_point = 0;
    if (!ReadHex4(code_point, error)) {
      return false;
    }

    if (code_point >= 0xD800U && code_point <= 0xDBFFU) {
      if (!StartsWith("\\u")) {
        return Fail("high surrogate without low surrogate", error);
      }
      AdvanceN(2);
      std::uint32_t low = 0;
      if (!ReadHex4(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("invalid low surrogate", error);
      }
      code_point = 0x10000U + ((code_point - 0xD800U) << 10U) + (low - 0xDC00U);
    } else if (code_point >= 0xDC00U && code_point <= 0xDFFFU) {
      return Fail("unexpected low surrogate", error);
    }

    AppendUtf8(output, code_point);
    return true;
  }

  bool ReadHex4(std::uint32_t& out, std::string& error) {
    out = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated unicode escape", error);
      }
      const char h = Advance();
      out <<= 4U;
      if (h >= '0' && h <= '9') {
        out |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        out |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        out |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in unicode escape", error);
      }
    }
    return true;
  }

  static void AppendUtf8(std::string& output, std::uint32_t cp) {
    if (cp < 0x80U) {
      output.push_back(static_cast<char>(cp));
    } else if (cp < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
      output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else if (cp < 0x10000U) {
      output.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
      output.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;

    if (Match('-')) {
      // optional sign
    }

    if (Match('0')) {
      // single leading zero
    } else {
      if (!ConsumeDigits()) {
        return Fail("expected digits in number", error);
      }
    }

    if (Match('.')) {
      if (!ConsumeDigits()) {
        return Fail("expected digits after decimal point", error);
      }
    }

    if (Match('e') || Match('E')) {
      if (Match('+') || Match('-')) {
        // exponent sign
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    errno = 0;
    output = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
      return Fail("invalid number token", error);
    }
    if (errno == ERANGE) {
      return Fail("numeric value out of range", error);
    }

    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (AtEnd() || Peek() != expected) {
      return Fail(message, error);
    }
    Advance();
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  bool StartsWith(std::string_view token) const {
    if (pos_ + token.size() > input_.size()) {
      return false;
    }
    return input_.substr(pos_, token.size()) == token;
  }

  void AdvanceN(std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
      Advance();
    }
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
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

} // namespace reconkit::core::json

#endif // RECONKIT_CORE_JSON_DOM_HPP_
