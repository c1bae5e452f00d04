/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/JsonReader.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>
#include <string_view>

namespace PetDock {

namespace {

// Nesting beyond this is rejected instead of overflowing the stack
constexpr int MAX_DEPTH = 64;

void writeEscaped(std::string &out, const std::string &text) {
  out += '"';
  for (const char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        out += std::format("\\u{:04x}", static_cast<unsigned>(c));
      } else {
        out += c;
      }
    }
  }
  out += '"';
}

void appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

} // namespace

// ---------------------------------------------------------------------------
// JsonValue
// ---------------------------------------------------------------------------

std::optional<bool> JsonValue::tryAsBool() const {
  if (const bool *value = std::get_if<bool>(&m_value)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double *value = std::get_if<double>(&m_value)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const std::string *value = std::get_if<std::string>(&m_value)) {
    return *value;
  }
  return std::nullopt;
}

const JsonValue *JsonValue::find(const std::string &key) const {
  const JsonObject *object = std::get_if<JsonObject>(&m_value);
  if (!object) {
    return nullptr;
  }
  auto it = object->find(key);
  return it != object->end() ? &it->second : nullptr;
}

std::string JsonValue::toString(int indent) const {
  std::string out;
  write(out, indent, 0);
  return out;
}

void JsonValue::write(std::string &out, int indent, int depth) const {
  const auto newline = [&](int level) {
    if (indent > 0) {
      out += '\n';
      out.append(static_cast<size_t>(indent * level), ' ');
    }
  };

  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number: {
    const double number = asNumber();
    if (!std::isfinite(number)) {
      out += "null";
    } else if (number == std::trunc(number) && std::fabs(number) < 1e15) {
      out += std::format("{}", static_cast<long long>(number));
    } else {
      out += std::format("{}", number);
    }
    break;
  }
  case JsonType::String:
    writeEscaped(out, asString());
    break;
  case JsonType::Array: {
    const JsonArray &array = asArray();
    out += '[';
    for (size_t i = 0; i < array.size(); ++i) {
      if (i > 0) {
        out += ',';
      }
      newline(depth + 1);
      array[i].write(out, indent, depth + 1);
    }
    if (!array.empty()) {
      newline(depth);
    }
    out += ']';
    break;
  }
  case JsonType::Object: {
    const JsonObject &object = asObject();
    out += '{';
    bool first = true;
    for (const auto &[key, value] : object) {
      if (!first) {
        out += ',';
      }
      first = false;
      newline(depth + 1);
      writeEscaped(out, key);
      out += indent > 0 ? ": " : ":";
      value.write(out, indent, depth + 1);
    }
    if (!object.empty()) {
      newline(depth);
    }
    out += '}';
    break;
  }
  }
}

// ---------------------------------------------------------------------------
// JsonReader
// ---------------------------------------------------------------------------

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    m_root = JsonValue();
    return false;
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_lastError.clear();
  m_root = JsonValue();

  skipWhitespace();
  std::optional<JsonValue> value = parseValue(0);
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

std::optional<JsonValue> JsonReader::parseValue(int depth) {
  if (depth > MAX_DEPTH) {
    setError("Nesting too deep");
    return std::nullopt;
  }

  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(depth);
  case '[':
    return parseArray(depth);
  case '"': {
    std::optional<std::string> text = parseString();
    if (!text) {
      return std::nullopt;
    }
    return JsonValue(std::move(*text));
  }
  case 't':
    if (parseLiteral("true")) {
      return JsonValue(true);
    }
    return std::nullopt;
  case 'f':
    if (parseLiteral("false")) {
      return JsonValue(false);
    }
    return std::nullopt;
  case 'n':
    if (parseLiteral("null")) {
      return JsonValue();
    }
    return std::nullopt;
  case '\0':
    setError("Unexpected end of input");
    return std::nullopt;
  default:
    return parseNumber();
  }
}

std::optional<JsonValue> JsonReader::parseObject(int depth) {
  consume('{');
  JsonObject object;

  skipWhitespace();
  if (consume('}')) {
    return JsonValue(std::move(object));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key");
      return std::nullopt;
    }
    std::optional<std::string> key = parseString();
    if (!key) {
      return std::nullopt;
    }

    skipWhitespace();
    if (!consume(':')) {
      setError("Expected ':' after key '" + *key + "'");
      return std::nullopt;
    }

    std::optional<JsonValue> value = parseValue(depth + 1);
    if (!value) {
      return std::nullopt;
    }
    // Duplicate keys: last one wins
    object[*key] = std::move(*value);

    skipWhitespace();
    if (consume(',')) {
      continue;
    }
    if (consume('}')) {
      return JsonValue(std::move(object));
    }
    setError("Expected ',' or '}' in object");
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseArray(int depth) {
  consume('[');
  JsonArray array;

  skipWhitespace();
  if (consume(']')) {
    return JsonValue(std::move(array));
  }

  while (true) {
    std::optional<JsonValue> value = parseValue(depth + 1);
    if (!value) {
      return std::nullopt;
    }
    array.push_back(std::move(*value));

    skipWhitespace();
    if (consume(',')) {
      continue;
    }
    if (consume(']')) {
      return JsonValue(std::move(array));
    }
    setError("Expected ',' or ']' in array");
    return std::nullopt;
  }
}

std::optional<std::string> JsonReader::parseString() {
  consume('"');
  std::string out;

  while (!atEnd()) {
    const char c = m_input[m_position++];
    if (c == '"') {
      return out;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return std::nullopt;
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    if (atEnd()) {
      break;
    }
    const char escape = m_input[m_position++];
    switch (escape) {
    case '"':
    case '\\':
    case '/':
      out += escape;
      break;
    case 'b':
      out += '\b';
      break;
    case 'f':
      out += '\f';
      break;
    case 'n':
      out += '\n';
      break;
    case 'r':
      out += '\r';
      break;
    case 't':
      out += '\t';
      break;
    case 'u':
      if (!appendUnicodeEscape(out)) {
        return std::nullopt;
      }
      break;
    default:
      setError(std::string("Invalid escape sequence \\") + escape);
      return std::nullopt;
    }
  }

  setError("Unterminated string");
  return std::nullopt;
}

bool JsonReader::appendUnicodeEscape(std::string &out) {
  const auto readHex = [this](uint32_t &value) {
    if (m_position + 4 > m_input.size()) {
      return false;
    }
    const char *begin = m_input.data() + m_position;
    auto [ptr, ec] = std::from_chars(begin, begin + 4, value, 16);
    if (ec != std::errc() || ptr != begin + 4) {
      return false;
    }
    m_position += 4;
    return true;
  };

  uint32_t codepoint = 0;
  if (!readHex(codepoint)) {
    setError("Invalid \\u escape");
    return false;
  }

  // Surrogate pair
  if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
    uint32_t low = 0;
    if (m_input.compare(m_position, 2, "\\u") != 0) {
      setError("Unpaired high surrogate");
      return false;
    }
    m_position += 2;
    if (!readHex(low) || low < 0xDC00 || low > 0xDFFF) {
      setError("Invalid low surrogate");
      return false;
    }
    codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
  }

  appendUtf8(out, codepoint);
  return true;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  const size_t start = m_position;
  if (peek() == '-') {
    ++m_position;
  }
  if (!std::isdigit(static_cast<unsigned char>(peek()))) {
    setError("Unexpected character");
    return std::nullopt;
  }

  const auto isNumberChar = [](char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == 'e' || c == 'E' ||
           c == '+' || c == '-';
  };
  while (!atEnd() && isNumberChar(peek())) {
    ++m_position;
  }

  double value = 0.0;
  const char *begin = m_input.data() + start;
  const char *end = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    m_position = start;
    setError("Invalid number '" + std::string(begin, end) + "'");
    return std::nullopt;
  }
  return JsonValue(value);
}

bool JsonReader::parseLiteral(const char *literal) {
  const std::string_view expected(literal);
  if (m_input.compare(m_position, expected.size(), expected) != 0) {
    setError("Invalid literal");
    return false;
  }
  m_position += expected.size();
  return true;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    const char c = m_input[m_position];
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      return;
    }
    ++m_position;
  }
}

bool JsonReader::consume(char expected) {
  if (peek() != expected) {
    return false;
  }
  ++m_position;
  return true;
}

void JsonReader::setError(const std::string &message) {
  // Keep the first error, it is the one closest to the cause
  if (!m_lastError.empty()) {
    return;
  }

  size_t line = 1;
  size_t column = 1;
  for (size_t i = 0; i < m_position && i < m_input.size(); ++i) {
    if (m_input[i] == '\n') {
      ++line;
      column = 1;
    } else {
      ++column;
    }
  }
  m_lastError = std::format("{} at line {}, column {}", message, line, column);
}

} // namespace PetDock
