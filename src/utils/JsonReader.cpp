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

namespace PopEngine {

namespace {
const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}

void appendUtf8(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
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

int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }
} // namespace

// JsonValue

JsonType JsonValue::getType() const {
  switch (m_value.index()) {
  case 1:
    return JsonType::Boolean;
  case 2:
    return JsonType::Number;
  case 3:
    return JsonType::String;
  case 4:
    return JsonType::Array;
  case 5:
    return JsonType::Object;
  default:
    return JsonType::Null;
  }
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

std::optional<float> JsonValue::tryAsFloat() const {
  if (isNumber())
    return static_cast<float>(asNumber());
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

float JsonValue::floatOr(const std::string &key, float fallback) const {
  return (*this)[key].tryAsFloat().value_or(fallback);
}

bool JsonValue::boolOr(const std::string &key, bool fallback) const {
  return (*this)[key].tryAsBool().value_or(fallback);
}

std::string JsonValue::stringOr(const std::string &key,
                                const std::string &fallback) const {
  return (*this)[key].tryAsString().value_or(fallback);
}

bool JsonValue::hasKey(const std::string &key) const {
  const auto *obj = tryAsObject();
  return obj != nullptr && obj->contains(key);
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const auto *obj = tryAsObject();
  if (obj == nullptr)
    return nullValue();
  auto it = obj->find(key);
  return it != obj->end() ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const auto *arr = tryAsArray();
  if (arr == nullptr || index >= arr->size())
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
  std::string out;
  write(out);
  return out;
}

void JsonValue::write(std::string &out) const {
  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number: {
    double num = asNumber();
    if (std::floor(num) == num && std::abs(num) < 1e15) {
      out += std::format("{}", static_cast<long long>(num));
    } else {
      out += std::format("{}", num);
    }
    break;
  }
  case JsonType::String:
    out += '"';
    for (char c : asString()) {
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
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
      }
    }
    out += '"';
    break;
  case JsonType::Array: {
    out += '[';
    bool first = true;
    for (const auto &item : asArray()) {
      if (!first)
        out += ',';
      first = false;
      item.write(out);
    }
    out += ']';
    break;
  }
  case JsonType::Object: {
    out += '{';
    bool first = true;
    for (const auto &[key, item] : asObject()) {
      if (!first)
        out += ',';
      first = false;
      JsonValue(key).write(out);
      out += ':';
      item.write(out);
    }
    out += '}';
    break;
  }
  }
}

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_lastError = std::format("Could not open file: {}", path);
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_lastError.clear();
  Cursor cur{jsonString};

  JsonValue root;
  skipWhitespace(cur);
  if (!parseValue(cur, root, 0)) {
    return false;
  }
  skipWhitespace(cur);
  if (cur.pos < cur.text.size()) {
    return fail(cur, "Unexpected trailing characters");
  }
  m_root = std::move(root);
  return true;
}

bool JsonReader::parseValue(Cursor &cur, JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail(cur, "Nesting too deep");
  }
  switch (peek(cur)) {
  case '{':
    return parseObject(cur, out, depth + 1);
  case '[':
    return parseArray(cur, out, depth + 1);
  case '"': {
    std::string s;
    if (!parseString(cur, s))
      return false;
    out = JsonValue(std::move(s));
    return true;
  }
  case 't':
    return parseLiteral(cur, "true", JsonValue(true), out);
  case 'f':
    return parseLiteral(cur, "false", JsonValue(false), out);
  case 'n':
    return parseLiteral(cur, "null", JsonValue(), out);
  case '\0':
    return fail(cur, "Unexpected end of input");
  default:
    if (peek(cur) == '-' || isDigit(peek(cur))) {
      return parseNumber(cur, out);
    }
    return fail(cur, std::format("Unexpected character '{}'", peek(cur)));
  }
}

bool JsonReader::parseObject(Cursor &cur, JsonValue &out, int depth) {
  advance(cur); // {
  JsonObject obj;
  skipWhitespace(cur);
  if (peek(cur) == '}') {
    advance(cur);
    out = JsonValue(std::move(obj));
    return true;
  }

  while (true) {
    skipWhitespace(cur);
    if (peek(cur) != '"') {
      return fail(cur, "Expected string key in object");
    }
    std::string key;
    if (!parseString(cur, key))
      return false;

    skipWhitespace(cur);
    if (advance(cur) != ':') {
      return fail(cur, "Expected ':' after object key");
    }
    skipWhitespace(cur);

    JsonValue member;
    if (!parseValue(cur, member, depth))
      return false;
    obj.insert_or_assign(std::move(key), std::move(member));

    skipWhitespace(cur);
    char c = advance(cur);
    if (c == '}')
      break;
    if (c != ',') {
      return fail(cur, "Expected ',' or '}' in object");
    }
  }
  out = JsonValue(std::move(obj));
  return true;
}

bool JsonReader::parseArray(Cursor &cur, JsonValue &out, int depth) {
  advance(cur); // [
  JsonArray arr;
  skipWhitespace(cur);
  if (peek(cur) == ']') {
    advance(cur);
    out = JsonValue(std::move(arr));
    return true;
  }

  while (true) {
    skipWhitespace(cur);
    JsonValue item;
    if (!parseValue(cur, item, depth))
      return false;
    arr.push_back(std::move(item));

    skipWhitespace(cur);
    char c = advance(cur);
    if (c == ']')
      break;
    if (c != ',') {
      return fail(cur, "Expected ',' or ']' in array");
    }
  }
  out = JsonValue(std::move(arr));
  return true;
}

bool JsonReader::parseString(Cursor &cur, std::string &out) {
  advance(cur); // opening quote
  while (true) {
    if (cur.pos >= cur.text.size()) {
      return fail(cur, "Unterminated string");
    }
    char c = advance(cur);
    if (c == '"')
      return true;
    if (c == '\n') {
      return fail(cur, "Unterminated string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    char esc = advance(cur);
    switch (esc) {
    case '"':
    case '\\':
    case '/':
      out += esc;
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
      uint32_t cp = 0;
      if (!parseUnicodeEscape(cur, cp))
        return false;
      // Surrogate pair
      if (cp >= 0xD800 && cp <= 0xDBFF && peek(cur) == '\\') {
        advance(cur);
        if (advance(cur) != 'u') {
          return fail(cur, "Expected low surrogate");
        }
        uint32_t low = 0;
        if (!parseUnicodeEscape(cur, low))
          return false;
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, cp);
      break;
    }
    default:
      return fail(cur, "Invalid escape sequence");
    }
  }
}

bool JsonReader::parseUnicodeEscape(Cursor &cur, uint32_t &codepoint) {
  codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    int v = hexValue(advance(cur));
    if (v < 0) {
      return fail(cur, "Invalid unicode escape");
    }
    codepoint = (codepoint << 4) | static_cast<uint32_t>(v);
  }
  return true;
}

bool JsonReader::parseNumber(Cursor &cur, JsonValue &out) {
  size_t start = cur.pos;
  if (peek(cur) == '-')
    advance(cur);
  if (!isDigit(peek(cur))) {
    return fail(cur, "Invalid number");
  }
  while (isDigit(peek(cur)))
    advance(cur);
  if (peek(cur) == '.') {
    advance(cur);
    if (!isDigit(peek(cur))) {
      return fail(cur, "Expected digit after decimal point");
    }
    while (isDigit(peek(cur)))
      advance(cur);
  }
  if (peek(cur) == 'e' || peek(cur) == 'E') {
    advance(cur);
    if (peek(cur) == '+' || peek(cur) == '-')
      advance(cur);
    if (!isDigit(peek(cur))) {
      return fail(cur, "Expected digit in exponent");
    }
    while (isDigit(peek(cur)))
      advance(cur);
  }

  std::string literal = cur.text.substr(start, cur.pos - start);
  out = JsonValue(std::strtod(literal.c_str(), nullptr));
  return true;
}

bool JsonReader::parseLiteral(Cursor &cur, const char *word, JsonValue value,
                              JsonValue &out) {
  for (const char *p = word; *p != '\0'; ++p) {
    if (advance(cur) != *p) {
      return fail(cur, std::format("Invalid literal, expected '{}'", word));
    }
  }
  out = std::move(value);
  return true;
}

void JsonReader::skipWhitespace(Cursor &cur) {
  while (cur.pos < cur.text.size()) {
    char c = cur.text[cur.pos];
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance(cur);
  }
}

char JsonReader::peek(const Cursor &cur) {
  return cur.pos < cur.text.size() ? cur.text[cur.pos] : '\0';
}

char JsonReader::advance(Cursor &cur) {
  if (cur.pos >= cur.text.size())
    return '\0';
  char c = cur.text[cur.pos++];
  if (c == '\n') {
    ++cur.line;
    cur.column = 1;
  } else {
    ++cur.column;
  }
  return c;
}

bool JsonReader::fail(const Cursor &cur, const std::string &message) {
  m_lastError = std::format("Line {}, Column {}: {}", cur.line, cur.column,
                            message);
  return false;
}

} // namespace PopEngine
