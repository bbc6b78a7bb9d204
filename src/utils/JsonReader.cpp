/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <sstream>

namespace Spacegame {

namespace {
const JsonValue &nullValue() {
  static const JsonValue s_null;
  return s_null;
}

void appendUtf8(std::string &out, uint32_t cp) {
  if (cp <= 0x7F) {
    out += static_cast<char>(cp);
  } else if (cp <= 0x7FF) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp <= 0xFFFF) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}
} // namespace

// JsonValue

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
  const auto *obj = tryAsObject();
  return obj && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const auto *obj = tryAsObject();
  if (!obj)
    return nullValue();
  auto it = obj->find(key);
  return it != obj->end() ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const auto *arr = tryAsArray();
  if (!arr || index >= arr->size())
    return nullValue();
  return (*arr)[index];
}

size_t JsonValue::size() const {
  if (const auto *arr = tryAsArray())
    return arr->size();
  if (const auto *obj = tryAsObject())
    return obj->size();
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream stream;
  writeToStream(stream);
  return stream.str();
}

void JsonValue::writeToStream(std::ostream &stream) const {
  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number:
    stream << asNumber();
    break;
  case JsonType::String:
    stream << "\"" << asString() << "\"";
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
      stream << "\"" << key << "\":";
      value.writeToStream(stream);
    }
    stream << "}";
    break;
  }
  }
}

// JsonReader

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
  m_root = JsonValue();

  skipWhitespace();
  if (m_position >= m_input.size()) {
    setError("Empty JSON input");
    return false;
  }

  JsonValue value = parseValue();
  if (failed())
    return false;

  skipWhitespace();
  if (m_position < m_input.size()) {
    setError("Unexpected token after JSON value");
    return false;
  }

  m_root = std::move(value);
  return true;
}

JsonValue JsonReader::parseValue() {
  skipWhitespace();
  char c = peek();
  switch (c) {
  case '{':
    return parseObject();
  case '[':
    return parseArray();
  case '"': {
    auto str = parseString();
    return str ? JsonValue(std::move(*str)) : JsonValue();
  }
  case 't':
    return parseLiteral("true") ? JsonValue(true) : JsonValue();
  case 'f':
    return parseLiteral("false") ? JsonValue(false) : JsonValue();
  case 'n':
    parseLiteral("null");
    return JsonValue();
  default:
    if (c == '-' || (c >= '0' && c <= '9')) {
      auto num = parseNumber();
      return num ? JsonValue(*num) : JsonValue();
    }
    setError(c == '\0' ? std::string("Unexpected end of input")
                       : "Unexpected character: " + std::string(1, c));
    return JsonValue();
  }
}

JsonValue JsonReader::parseObject() {
  JsonObject result;
  advance(); // '{'
  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(result));
  }

  while (!failed()) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      break;
    }
    auto key = parseString();
    if (!key)
      break;
    skipWhitespace();
    if (advance() != ':') {
      setError("Expected ':' after object key");
      break;
    }
    JsonValue value = parseValue();
    if (failed())
      break;
    result.insert_or_assign(std::move(*key), std::move(value));

    skipWhitespace();
    char next = advance();
    if (next == '}')
      return JsonValue(std::move(result));
    if (next != ',') {
      setError("Expected ',' or '}' in object");
      break;
    }
  }
  return JsonValue();
}

JsonValue JsonReader::parseArray() {
  JsonArray result;
  advance(); // '['
  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(result));
  }

  while (!failed()) {
    JsonValue value = parseValue();
    if (failed())
      break;
    result.push_back(std::move(value));

    skipWhitespace();
    char next = advance();
    if (next == ']')
      return JsonValue(std::move(result));
    if (next != ',') {
      setError("Expected ',' or ']' in array");
      break;
    }
  }
  return JsonValue();
}

std::optional<std::string> JsonReader::parseString() {
  advance(); // opening quote
  std::string result;
  while (m_position < m_input.size()) {
    char c = advance();
    if (c == '"')
      return result;
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return std::nullopt;
    }
    if (c != '\\') {
      result += c;
      continue;
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
    case 'u': {
      auto cp = parseHex4();
      if (!cp)
        return std::nullopt;
      uint32_t codepoint = *cp;
      // Surrogate pair
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF && peek() == '\\') {
        advance();
        if (advance() != 'u') {
          setError("Invalid surrogate pair");
          return std::nullopt;
        }
        auto low = parseHex4();
        if (!low)
          return std::nullopt;
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (*low - 0xDC00);
      }
      appendUtf8(result, codepoint);
      break;
    }
    default:
      setError("Invalid escape sequence: \\" + std::string(1, escaped));
      return std::nullopt;
    }
  }

  setError("Unterminated string");
  return std::nullopt;
}

std::optional<double> JsonReader::parseNumber() {
  size_t start = m_position;
  auto isDigit = [](char c) { return c >= '0' && c <= '9'; };

  if (peek() == '-')
    advance();
  if (!isDigit(peek())) {
    setError("Invalid number format");
    return std::nullopt;
  }
  while (isDigit(peek()))
    advance();
  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit after decimal point");
      return std::nullopt;
    }
    while (isDigit(peek()))
      advance();
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit in exponent");
      return std::nullopt;
    }
    while (isDigit(peek()))
      advance();
  }

  try {
    return std::stod(m_input.substr(start, m_position - start));
  } catch (const std::exception &e) {
    setError(std::format("Invalid number: {}", e.what()));
    return std::nullopt;
  }
}

bool JsonReader::parseLiteral(const char *word) {
  for (const char *p = word; *p; ++p) {
    if (advance() != *p) {
      setError(std::format("Invalid literal, expected '{}'", word));
      return false;
    }
  }
  return true;
}

std::optional<uint32_t> JsonReader::parseHex4() {
  uint32_t result = 0;
  for (int i = 0; i < 4; ++i) {
    char c = advance();
    uint32_t digit = 0;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      setError("Invalid Unicode escape sequence");
      return std::nullopt;
    }
    result = (result << 4) | digit;
  }
  return result;
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size())
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

void JsonReader::skipWhitespace() {
  while (m_position < m_input.size()) {
    char c = m_input[m_position];
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
      break;
    advance();
  }
}

void JsonReader::setError(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
  }
}

} // namespace Spacegame
