#ifndef RELPACK_CORE_JSON_DOM_HPP_
#define RELPACK_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relpack::core::json {

// Small STL-only DOM for release configs and the local registry index.
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

  // Returns nullptr when this is not an object or the key is absent.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
  }
};

// Recursive-descent parser. Diagnostics carry line/column of the offending
// character.
class Parser {
public:
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
  static constexpr int kMaxDepth = 64;

  bool ParseValue(Value& value, int depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("nesting too deep", error);
    }
    if (pos_ >= input_.size()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = input_[pos_];
    switch (c) {
    case '{':
      return ParseObject(value, depth, error);
    case '[':
      return ParseArray(value, depth, error);
    case '"':
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    case 't':
      return ParseLiteral("true", value, Value::Type::kBool, true, error);
    case 'f':
      return ParseLiteral("false", value, Value::Type::kBool, false, error);
    case 'n':
      return ParseLiteral("null", value, Value::Type::kNull, false, error);
    default:
      break;
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    return Fail("expected JSON value", error);
  }

  bool ParseLiteral(std::string_view word, Value& value, Value::Type type, bool flag,
                    std::string& error) {
    if (input_.substr(pos_, word.size()) != word) {
      return Fail("expected JSON value", error);
    }
    Skip(word.size());
    value.type = type;
    value.bool_value = flag;
    return true;
  }

  bool ParseObject(Value& value, int depth, std::string& error) {
    value = Value{};
    value.type = Value::Type::kObject;
    Skip(1);
    SkipWhitespace();
    if (TryConsume('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      if (pos_ >= input_.size() || input_[pos_] != '"') {
        return Fail("expected string key in object", error);
      }
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }
      SkipWhitespace();
      if (!TryConsume(':')) {
        return Fail("expected ':' after object key", error);
      }
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth + 1, error)) {
        return false;
      }
      value.object_value[std::move(key)] = std::move(item);

      SkipWhitespace();
      if (TryConsume('}')) {
        return true;
      }
      if (!TryConsume(',')) {
        return Fail("expected ',' or '}' in object", error);
      }
    }
  }

  bool ParseArray(Value& value, int depth, std::string& error) {
    value = Value{};
    value.type = Value::Type::kArray;
    Skip(1);
    SkipWhitespace();
    if (TryConsume(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth + 1, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (TryConsume(']')) {
        return true;
      }
      if (!TryConsume(',')) {
        return Fail("expected ',' or ']' in array", error);
      }
    }
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    Skip(1);

    while (pos_ < input_.size()) {
      const char c = input_[pos_];
      Skip(1);
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
      const char esc = input_[pos_];
      Skip(1);
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
    }

    return Fail("unterminated string literal", error);
  }

  // Basic multilingual plane only; surrogate pairs are rejected.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    if (pos_ + 4U > input_.size()) {
      return Fail("truncated \\u escape", error);
    }
    unsigned int code_point = 0;
    for (std::size_t i = 0; i < 4U; ++i) {
      const char h = input_[pos_ + i];
      code_point <<= 4U;
      if (h >= '0' && h <= '9') {
        code_point |= static_cast<unsigned int>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code_point |= static_cast<unsigned int>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code_point |= static_cast<unsigned int>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }
    Skip(4);

    if (code_point >= 0xD800U && code_point <= 0xDFFFU) {
      return Fail("surrogate \\u escapes are not supported", error);
    }
    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
    return true;
  }

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

    const std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    output = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
      return Fail("invalid number token", error);
    }
    return true;
  }

  std::size_t SkipDigits() {
    std::size_t count = 0;
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
      Skip(1);
      ++count;
    }
    return count;
  }

  void SkipWhitespace() {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_])) != 0) {
      Skip(1);
    }
  }

  bool TryConsume(char expected) {
    if (pos_ < input_.size() && input_[pos_] == expected) {
      Skip(1);
      return true;
    }
    return false;
  }

  void Skip(std::size_t count) {
    for (std::size_t i = 0; i < count && pos_ < input_.size(); ++i) {
      if (input_[pos_++] == '\n') {
        ++line_;
        col_ = 1;
      } else {
        ++col_;
      }
    }
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

} // namespace relpack::core::json

#endif // RELPACK_CORE_JSON_DOM_HPP_
