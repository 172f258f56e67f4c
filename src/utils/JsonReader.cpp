/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Wayfarer {

namespace {

struct JsonParseError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

const JsonValue &nullValue() {
  static const JsonValue s_null;
  return s_null;
}

void writeEscaped(std::ostream &out, const std::string &text) {
  out << '"';
  for (char c : text) {
    switch (c) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(c) << std::dec << std::setfill(' ');
      } else {
        out << c;
      }
    }
  }
  out << '"';
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

// JsonValue

JsonType JsonValue::getType() const {
  return static_cast<JsonType>(m_value.index());
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool()) {
    return asBool();
  }
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber()) {
    return asNumber();
  }
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber()) {
    return asInt();
  }
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString()) {
    return asString();
  }
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().count(key) > 0;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (!isObject()) {
    return nullValue();
  }
  const auto &obj = asObject();
  auto it = obj.find(key);
  return it != obj.end() ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  if (!isArray() || index >= asArray().size()) {
    return nullValue();
  }
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray()) {
    return asArray().size();
  }
  if (isObject()) {
    return asObject().size();
  }
  return 0;
}

std::string JsonValue::toString(int indent) const {
  std::ostringstream out;
  write(out, indent, 0);
  return out.str();
}

void JsonValue::write(std::ostream &out, int indent, int depth) const {
  const std::string pad = indent > 0 ? std::string(static_cast<size_t>(indent * (depth + 1)), ' ') : "";
  const std::string closePad = indent > 0 ? std::string(static_cast<size_t>(indent * depth), ' ') : "";
  const char *newline = indent > 0 ? "\n" : "";

  switch (getType()) {
  case JsonType::Null:
    out << "null";
    break;
  case JsonType::Boolean:
    out << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    const double number = asNumber();
    if (std::isfinite(number) && number == std::floor(number) && std::fabs(number) < 1e15) {
      out << static_cast<long long>(number);
    } else {
      out << std::setprecision(9) << number;
    }
    break;
  }
  case JsonType::String:
    writeEscaped(out, asString());
    break;
  case JsonType::Array: {
    const auto &arr = asArray();
    if (arr.empty()) {
      out << "[]";
      break;
    }
    out << '[' << newline;
    for (size_t i = 0; i < arr.size(); ++i) {
      out << pad;
      arr[i].write(out, indent, depth + 1);
      out << (i + 1 < arr.size() ? "," : "") << newline;
    }
    out << closePad << ']';
    break;
  }
  case JsonType::Object: {
    const auto &obj = asObject();
    if (obj.empty()) {
      out << "{}";
      break;
    }
    out << '{' << newline;
    size_t i = 0;
    for (const auto &[key, value] : obj) {
      out << pad;
      writeEscaped(out, key);
      out << (indent > 0 ? ": " : ":");
      value.write(out, indent, depth + 1);
      out << (++i < obj.size() ? "," : "") << newline;
    }
    out << closePad << '}';
    break;
  }
  }
}

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Failed to open file: " + path;
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
  m_line = 1;
  m_column = 1;
  m_depth = 0;
  m_lastError.clear();
  m_root = JsonValue();

  try {
    skipWhitespace();
    if (m_position >= m_input.size()) {
      fail("Empty input");
    }
    JsonValue root = parseValue();
    skipWhitespace();
    if (m_position < m_input.size()) {
      fail("Unexpected trailing characters");
    }
    m_root = std::move(root);
    return true;
  } catch (const JsonParseError &e) {
    m_lastError = e.what();
    return false;
  }
}

JsonValue JsonReader::parseValue() {
  skipWhitespace();
  const char c = peek();
  switch (c) {
  case '{':
    return parseObject();
  case '[':
    return parseArray();
  case '"':
    return JsonValue(parseString());
  case 't':
    expectLiteral("true");
    return JsonValue(true);
  case 'f':
    expectLiteral("false");
    return JsonValue(false);
  case 'n':
    expectLiteral("null");
    return JsonValue();
  default:
    if (c == '-' || (c >= '0' && c <= '9')) {
      return parseNumber();
    }
    if (c == '\0') {
      fail("Unexpected end of input");
    }
    fail(std::string("Unexpected character '") + c + "'");
  }
}

JsonValue JsonReader::parseObject() {
  if (++m_depth > MAX_DEPTH) {
    fail("Nesting too deep");
  }
  advance(); // {
  JsonObject obj;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    --m_depth;
    return JsonValue(std::move(obj));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      fail("Expected string key");
    }
    std::string key = parseString();

    skipWhitespace();
    if (peek() != ':') {
      fail("Expected ':' after key");
    }
    advance();

    obj[std::move(key)] = parseValue();

    skipWhitespace();
    const char next = advance();
    if (next == '}') {
      break;
    }
    if (next != ',') {
      fail("Expected ',' or '}' in object");
    }
  }

  --m_depth;
  return JsonValue(std::move(obj));
}

JsonValue JsonReader::parseArray() {
  if (++m_depth > MAX_DEPTH) {
    fail("Nesting too deep");
  }
  advance(); // [
  JsonArray arr;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    --m_depth;
    return JsonValue(std::move(arr));
  }

  while (true) {
    arr.push_back(parseValue());

    skipWhitespace();
    const char next = advance();
    if (next == ']') {
      break;
    }
    if (next != ',') {
      fail("Expected ',' or ']' in array");
    }
  }

  --m_depth;
  return JsonValue(std::move(arr));
}

std::string JsonReader::parseString() {
  advance(); // opening quote
  std::string result;

  while (true) {
    if (m_position >= m_input.size()) {
      fail("Unterminated string");
    }
    const char c = advance();
    if (c == '"') {
      break;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      fail("Control character in string");
    }
    if (c != '\\') {
      result += c;
      continue;
    }

    const char escape = advance();
    switch (escape) {
    case '"':
      result += '"';
      break;
    case '\\':
      result += '\\';
      break;
    case '/':
      result += '/';
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
      uint32_t codepoint = parseHex4();
      // Surrogate pair
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        if (advance() != '\\' || advance() != 'u') {
          fail("Unpaired surrogate in string");
        }
        const uint32_t low = parseHex4();
        if (low < 0xDC00 || low > 0xDFFF) {
          fail("Invalid low surrogate in string");
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(result, codepoint);
      break;
    }
    default:
      fail(std::string("Invalid escape '\\") + escape + "'");
    }
  }

  return result;
}

uint32_t JsonReader::parseHex4() {
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    const char c = advance();
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      value |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      value |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      fail("Invalid unicode escape");
    }
  }
  return value;
}

JsonValue JsonReader::parseNumber() {
  const size_t start = m_position;
  auto digits = [this]() {
    size_t count = 0;
    while (peek() >= '0' && peek() <= '9') {
      advance();
      ++count;
    }
    return count;
  };

  if (peek() == '-') {
    advance();
  }
  if (peek() == '0') {
    advance();
  } else if (digits() == 0) {
    fail("Invalid number");
  }
  if (peek() == '.') {
    advance();
    if (digits() == 0) {
      fail("Expected digit after decimal point");
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (digits() == 0) {
      fail("Expected digit in exponent");
    }
  }

  const std::string text = m_input.substr(start, m_position - start);
  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    fail("Number out of range: " + text);
  }
  return JsonValue(value);
}

void JsonReader::expectLiteral(const char *literal) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (peek() != *p) {
      fail(std::string("Invalid literal, expected '") + literal + "'");
    }
    advance();
  }
}

void JsonReader::skipWhitespace() {
  while (m_position < m_input.size()) {
    const char c = m_input[m_position];
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    advance();
  }
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size()) {
    fail("Unexpected end of input");
  }
  const char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::fail(const std::string &message) const {
  throw JsonParseError("line " + std::to_string(m_line) + ", column " +
                       std::to_string(m_column) + ": " + message);
}

} // namespace Wayfarer
