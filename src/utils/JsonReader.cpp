/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/JsonReader.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>

namespace Traverse {

namespace {
const JsonValue s_nullValue{};

bool isDigit(char c) { return c >= '0' && c <= '9'; }

int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

void appendUtf8(std::string &out, uint32_t codePoint) {
  if (codePoint < 0x80) {
    out += static_cast<char>(codePoint);
  } else if (codePoint < 0x800) {
    out += static_cast<char>(0xC0 | (codePoint >> 6));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  } else if (codePoint < 0x10000) {
    out += static_cast<char>(0xE0 | (codePoint >> 12));
    out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codePoint >> 18));
    out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  }
}
} // anonymous namespace

// JsonValue implementation

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

bool JsonValue::hasKey(const std::string &key) const {
  if (!isObject())
    return false;
  const JsonObject &obj = asObject();
  return obj.find(key) != obj.end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (!isObject())
    return s_nullValue;
  const JsonObject &obj = asObject();
  auto it = obj.find(key);
  return it != obj.end() ? it->second : s_nullValue;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  if (!isArray())
    return s_nullValue;
  const JsonArray &arr = asArray();
  return index < arr.size() ? arr[index] : s_nullValue;
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

// JsonReader implementation

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_line = 1;
    m_column = 1;
    return fail("Could not open file: " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  skipWhitespace();
  if (atEnd()) {
    return fail("Empty JSON input");
  }

  JsonValue root;
  if (!parseValue(root, 0)) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected token after JSON value");
  }

  m_root = std::move(root);
  return true;
}

bool JsonReader::parseValue(JsonValue &out, size_t depth) {
  if (depth > MAX_DEPTH) {
    return fail(std::format("Nesting deeper than {} levels", MAX_DEPTH));
  }

  skipWhitespace();
  if (atEnd()) {
    return fail("Unexpected end of input, expected a value");
  }

  const char c = peek();
  switch (c) {
  case '{':
    return parseObject(out, depth);
  case '[':
    return parseArray(out, depth);
  case '"': {
    std::string text;
    if (!parseString(text))
      return false;
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  default:
    if (c == '-' || isDigit(c)) {
      return parseNumber(out);
    }
    return fail("Unexpected character: " + std::string(1, c));
  }
}

bool JsonReader::parseObject(JsonValue &out, size_t depth) {
  advance(); // {
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key in object");
    }

    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (peek() != ':') {
      return fail("Expected ':' after object key");
    }
    advance();

    JsonValue value;
    if (!parseValue(value, depth + 1))
      return false;
    // Later duplicates win
    object[std::move(key)] = std::move(value);

    skipWhitespace();
    const char next = peek();
    if (next == ',') {
      advance();
      continue;
    }
    if (next == '}') {
      advance();
      break;
    }
    return fail("Expected '}' or ',' in object");
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, size_t depth) {
  advance(); // [
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element, depth + 1))
      return false;
    array.push_back(std::move(element));

    skipWhitespace();
    const char next = peek();
    if (next == ',') {
      advance();
      continue;
    }
    if (next == ']') {
      advance();
      break;
    }
    return fail("Expected ']' or ',' in array");
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote

  while (!atEnd()) {
    const char c = advance();
    if (c == '"') {
      return true;
    }

    if (c == '\\') {
      if (atEnd()) {
        return fail("Unexpected end of input in string escape");
      }
      const char escaped = advance();
      switch (escaped) {
      case '"':
      case '\\':
      case '/':
        out += escaped;
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
      case 'u': {
        uint32_t codePoint = 0;
        if (!parseUnicodeEscape(codePoint))
          return false;
        // Surrogate pair
        if (codePoint >= 0xD800 && codePoint <= 0xDBFF) {
          if (peek() != '\\') {
            return fail("Unpaired high surrogate in string");
          }
          advance();
          if (peek() != 'u') {
            return fail("Unpaired high surrogate in string");
          }
          advance();
          uint32_t low = 0;
          if (!parseUnicodeEscape(low))
            return false;
          if (low < 0xDC00 || low > 0xDFFF) {
            return fail("Invalid low surrogate in string");
          }
          codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (low - 0xDC00);
        }
        appendUtf8(out, codePoint);
        break;
      }
      default:
        return fail("Invalid escape sequence: \\" + std::string(1, escaped));
      }
      continue;
    }

    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Unescaped control character in string");
    }
    out += c;
  }

  return fail("Unterminated string");
}

bool JsonReader::parseUnicodeEscape(uint32_t &codePoint) {
  codePoint = 0;
  for (int i = 0; i < 4; ++i) {
    const int digit = atEnd() ? -1 : hexValue(peek());
    if (digit < 0) {
      return fail("Invalid Unicode escape sequence");
    }
    advance();
    codePoint = (codePoint << 4) | static_cast<uint32_t>(digit);
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek()))
      advance();
  } else {
    return fail("Invalid number format");
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      return fail("Invalid number format: expected digit after decimal point");
    }
    while (isDigit(peek()))
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek())) {
      return fail("Invalid number format: expected digit in exponent");
    }
    while (isDigit(peek()))
      advance();
  }

  const std::string text = m_input.substr(start, m_position - start);
  errno = 0;
  const double value = std::strtod(text.c_str(), nullptr);
  if (errno == ERANGE && std::isinf(value)) {
    return fail("Number out of range: " + text);
  }

  out = JsonValue(value);
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value, JsonValue &out) {
  const size_t length = std::strlen(literal);
  if (m_input.compare(m_position, length, literal) != 0) {
    return fail(std::format("Invalid token starting with '{}'", literal[0]));
  }
  for (size_t i = 0; i < length; ++i)
    advance();
  out = std::move(value);
  return true;
}

char JsonReader::peek() const { return atEnd() ? '\0' : m_input[m_position]; }

char JsonReader::advance() {
  if (atEnd())
    return '\0';
  const char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    const char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance();
  }
}

bool JsonReader::fail(const std::string &message) {
  m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
  return false;
}

} // namespace Traverse
