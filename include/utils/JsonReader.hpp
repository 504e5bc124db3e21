/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace PopEngine {

class JsonValue;

using JsonObject = std::unordered_map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

// Stream operator for JsonType (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null:
    return os << "Null";
  case JsonType::Boolean:
    return os << "Boolean";
  case JsonType::Number:
    return os << "Number";
  case JsonType::String:
    return os << "String";
  case JsonType::Array:
    return os << "Array";
  case JsonType::Object:
    return os << "Object";
  }
  return os << "Unknown";
}

/**
 * Immutable-ish JSON tree node. Level scripts and the physics config file
 * are read through this type; lookups of missing keys return a shared null
 * value so chained access never throws.
 */
class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(std::string value) : m_value(std::move(value)) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

  JsonType getType() const;
  bool isNull() const { return std::holds_alternative<std::nullptr_t>(m_value); }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  // Throw std::bad_variant_access on the wrong type
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  int asInt() const { return static_cast<int>(std::get<double>(m_value)); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  std::optional<float> tryAsFloat() const;
  std::optional<int> tryAsInt() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;
  const JsonObject *tryAsObject() const;

  // Member lookups with a fallback for absent or mistyped keys
  float floatOr(const std::string &key, float fallback) const;
  bool boolOr(const std::string &key, bool fallback) const;
  std::string stringOr(const std::string &key, const std::string &fallback) const;

  bool hasKey(const std::string &key) const;
  const JsonValue &operator[](const std::string &key) const;
  const JsonValue &operator[](size_t index) const;
  size_t size() const;

  std::string toString() const;

private:
  void write(std::string &out) const;

  ValueType m_value;
};

/**
 * Recursive descent JSON parser. Errors carry "Line L, Column C: reason"
 * and leave the previous root untouched.
 */
class JsonReader {
public:
  JsonReader() = default;

  bool loadFromFile(const std::string &path);
  bool parse(const std::string &jsonString);
  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

private:
  // Nesting limit keeps hostile input from exhausting the stack
  static constexpr int MAX_DEPTH = 64;

  struct Cursor {
    const std::string &text;
    size_t pos{0};
    size_t line{1};
    size_t column{1};
  };

  bool parseValue(Cursor &cur, JsonValue &out, int depth);
  bool parseObject(Cursor &cur, JsonValue &out, int depth);
  bool parseArray(Cursor &cur, JsonValue &out, int depth);
  bool parseString(Cursor &cur, std::string &out);
  bool parseNumber(Cursor &cur, JsonValue &out);
  bool parseLiteral(Cursor &cur, const char *word, JsonValue value,
                    JsonValue &out);
  bool parseUnicodeEscape(Cursor &cur, uint32_t &codepoint);

  static void skipWhitespace(Cursor &cur);
  static char peek(const Cursor &cur);
  static char advance(Cursor &cur);
  bool fail(const Cursor &cur, const std::string &message);

  std::string m_lastError;
  JsonValue m_root;
};

} // namespace PopEngine

#endif // JSONREADER_HPP
