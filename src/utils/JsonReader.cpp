/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace ArenaEngine {

namespace {
// Guards against stack exhaustion on hostile map files
constexpr size_t MAX_NESTING_DEPTH = 128;

void writeEscaped(std::ostream &stream, const std::string &text) {
  stream << '"';
  for (char c : text) {
    switch (c) {
    case '"':
      stream << "\\\"";
      break;
    case '\\':
      stream << "\\\\";
      break;
    case '\n':
      stream << "\\n";
      break;
    case '\t':
      stream << "\\t";
      break;
    case '\r':
      stream << "\\r";
      break;
    default:
      stream << c;
    }
  }
  stream << '"';
}

struct DepthGuard {
  explicit DepthGuard(size_t &depth) : m_depth(depth) { ++m_depth; }
  ~DepthGuard() { --m_depth; }
  size_t &m_depth;
};
} // namespace

JsonType JsonValue::getType() const {
  return static_cast<JsonType>(m_value.index());
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber())
    return asInt();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  return obj != nullptr && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  const JsonObject *obj = tryAsObject();
  if (obj == nullptr)
    return null_value;
  auto it = obj->find(key);
  return (it != obj->end()) ? it->second : null_value;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  const JsonArray *arr = tryAsArray();
  if (arr == nullptr || index >= arr->size())
    return null_value;
  return (*arr)[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream oss;
  writeToStream(oss);
  return oss.str();
}

void JsonValue::writeToStream(std::ostream &stream) const {
  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    double num = asNumber();
    if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      stream << num;
    }
    break;
  }
  case JsonType::String:
    writeEscaped(stream, asString());
    break;
  case JsonType::Array: {
    stream << "[";
    const auto &arr = asArray();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ",";
      arr[i].writeToStream(stream);
    }
    stream << "]";
    break;
  }
  case JsonType::Object: {
    stream << "{";
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first)
        stream << ",";
      first = false;
      writeEscaped(stream, key);
      stream << ":";
      value.writeToStream(stream);
    }
    stream << "}";
    break;
  }
  }
}

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_depth = 0;
  m_root = JsonValue();

  skipWhitespace();
  if (atEnd()) {
    setError("Empty JSON input");
    return false;
  }

  std::optional<JsonValue> value = parseValue();
  if (!value) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    setError("Unexpected trailing characters");
    return false;
  }

  m_root = std::move(*value);
  return true;
}

void JsonReader::setError(const std::string &message) {
  m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';
  char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

bool JsonReader::consume(char expected) {
  skipWhitespace();
  if (peek() != expected) {
    return false;
  }
  advance();
  return true;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance();
  }
}

std::optional<JsonValue> JsonReader::parseValue() {
  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject();
  case '[':
    return parseArray();
  case '"': {
    auto str = parseString();
    if (!str)
      return std::nullopt;
    return JsonValue(std::move(*str));
  }
  case 't':
  case 'f':
  case 'n':
    return parseLiteral();
  default:
    break;
  }

  char c = peek();
  if (c == '-' || (c >= '0' && c <= '9')) {
    return parseNumber();
  }
  if (atEnd()) {
    setError("Unexpected end of input");
  } else {
    setError(std::format("Unexpected character '{}'", c));
  }
  return std::nullopt;
}

std::optional<JsonValue> JsonReader::parseObject() {
  if (m_depth >= MAX_NESTING_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return std::nullopt;
  }
  DepthGuard guard(m_depth);

  advance(); // '{'
  JsonObject obj;
  if (consume('}')) {
    return JsonValue(std::move(obj));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return std::nullopt;
    }
    auto key = parseString();
    if (!key)
      return std::nullopt;

    if (!consume(':')) {
      setError("Expected ':' after object key");
      return std::nullopt;
    }

    auto value = parseValue();
    if (!value)
      return std::nullopt;
    obj.insert_or_assign(std::move(*key), std::move(*value));

    if (consume(','))
      continue;
    if (consume('}'))
      return JsonValue(std::move(obj));
    setError("Expected ',' or '}' in object");
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseArray() {
  if (m_depth >= MAX_NESTING_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return std::nullopt;
  }
  DepthGuard guard(m_depth);

  advance(); // '['
  JsonArray arr;
  if (consume(']')) {
    return JsonValue(std::move(arr));
  }

  while (true) {
    auto value = parseValue();
    if (!value)
      return std::nullopt;
    arr.push_back(std::move(*value));

    if (consume(','))
      continue;
    if (consume(']'))
      return JsonValue(std::move(arr));
    setError("Expected ',' or ']' in array");
    return std::nullopt;
  }
}

std::optional<std::string> JsonReader::parseString() {
  advance(); // opening quote

  std::string result;
  while (!atEnd()) {
    char c = advance();

    if (c == '"') {
      return result;
    }

    if (c == '\\') {
      if (atEnd()) {
        setError("Unexpected end of input in string escape");
        return std::nullopt;
      }
      char escaped = advance();
      switch (escaped) {
      case '"':
      case '\\':
      case '/':
        result += escaped;
        break;
      case 'b':
        result += '\b';
        break;
      case 'f':
        result += '\f';
        break;
      case 'n':
        result += '\n';
        break;
      case 'r':
        result += '\r';
        break;
      case 't':
        result += '\t';
        break;
      case 'u':
        if (!parseUnicodeEscape(result))
          return std::nullopt;
        break;
      default:
        setError("Invalid escape sequence: \\" + std::string(1, escaped));
        return std::nullopt;
      }
    } else if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return std::nullopt;
    } else {
      result += c;
    }
  }

  setError("Unterminated string");
  return std::nullopt;
}

bool JsonReader::parseUnicodeEscape(std::string &out) {
  uint32_t codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    char c = peek();
    uint32_t digit;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      setError("Invalid Unicode escape sequence");
      return false;
    }
    advance();
    codepoint = (codepoint << 4) | digit;
  }

  // UTF-8 encode (basic multilingual plane only)
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
  return true;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (peek() >= '1' && peek() <= '9') {
    while (peek() >= '0' && peek() <= '9')
      advance();
  } else {
    setError("Invalid number");
    return std::nullopt;
  }

  if (peek() == '.') {
    advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      setError("Expected digit after decimal point");
      return std::nullopt;
    }
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      setError("Expected digit in exponent");
      return std::nullopt;
    }
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  std::string text = m_input.substr(start, m_position - start);
  return JsonValue(std::strtod(text.c_str(), nullptr));
}

std::optional<JsonValue> JsonReader::parseLiteral() {
  auto matches = [this](const char *word) {
    size_t len = std::char_traits<char>::length(word);
    return m_input.compare(m_position, len, word) == 0;
  };
  auto skip = [this](size_t count) {
    for (size_t i = 0; i < count; ++i)
      advance();
  };

  if (matches("true")) {
    skip(4);
    return JsonValue(true);
  }
  if (matches("false")) {
    skip(5);
    return JsonValue(false);
  }
  if (matches("null")) {
    skip(4);
    return JsonValue();
  }
  setError("Invalid literal");
  return std::nullopt;
}

} // namespace ArenaEngine
