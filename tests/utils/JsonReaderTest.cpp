/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <cstdio>
#include <fstream>
#include <string>

using namespace PopEngine;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);
  BOOST_CHECK_EQUAL(nullVal.toString(), "null");

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);
  BOOST_CHECK_EQUAL(trueVal.toString(), "true");

  JsonValue intVal(42);
  JsonValue doubleVal(0.95);
  BOOST_CHECK(intVal.isNumber());
  BOOST_CHECK_EQUAL(intVal.asInt(), 42);
  BOOST_CHECK_CLOSE(doubleVal.asNumber(), 0.95, 0.001);

  JsonValue stringVal("pipes");
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.asString(), "pipes");
  BOOST_CHECK_EQUAL(stringVal.toString(), "\"pipes\"");
}

// Test the optional accessors used by the level loader
BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue stringVal("basic");
  JsonValue numberVal(3);
  JsonValue fractional(2.5);

  BOOST_CHECK(stringVal.tryAsString().has_value());
  BOOST_CHECK_EQUAL(stringVal.tryAsString().value(), "basic");
  BOOST_CHECK_EQUAL(numberVal.tryAsInt().value(), 3);
  BOOST_CHECK_CLOSE(fractional.tryAsFloat().value(), 2.5f, 0.001f);

  BOOST_CHECK(!stringVal.tryAsInt().has_value());
  BOOST_CHECK(!stringVal.tryAsFloat().has_value());
  BOOST_CHECK(!numberVal.tryAsString().has_value());
  BOOST_CHECK(numberVal.tryAsArray() == nullptr);
  BOOST_CHECK(numberVal.tryAsObject() == nullptr);
}

// Test that missing keys and indexes resolve to null instead of throwing
BOOST_AUTO_TEST_CASE(TestMissingLookupsAreNull) {
  JsonObject obj;
  obj["waves"] = JsonValue(JsonArray{JsonValue(1)});
  JsonValue root(obj);

  BOOST_CHECK(root["missing"].isNull());
  BOOST_CHECK(root["missing"]["deeper"].isNull());
  BOOST_CHECK(root["waves"][5].isNull());
  BOOST_CHECK(JsonValue(7)["key"].isNull());
  BOOST_CHECK_EQUAL(root["waves"][0].asInt(), 1);
}

BOOST_AUTO_TEST_CASE(TestFallbackAccessors) {
  JsonObject obj;
  obj["duration"] = JsonValue(12.5);
  obj["enabled"] = JsonValue(false);
  obj["pattern"] = JsonValue("crazy");
  obj["count"] = JsonValue("three");
  JsonValue node(obj);

  BOOST_CHECK_CLOSE(node.floatOr("duration", 0.0f), 12.5f, 0.001f);
  BOOST_CHECK_CLOSE(node.floatOr("absent", 4.0f), 4.0f, 0.001f);
  BOOST_CHECK_CLOSE(node.floatOr("count", 1.0f), 1.0f, 0.001f);
  BOOST_CHECK_EQUAL(node.boolOr("enabled", true), false);
  BOOST_CHECK_EQUAL(node.boolOr("absent", true), true);
  BOOST_CHECK_EQUAL(node.stringOr("pattern", "random"), "crazy");
  BOOST_CHECK_EQUAL(node.stringOr("duration", "random"), "random");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestBasicParsing) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(reader.parse("false"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), false);

  BOOST_CHECK(reader.parse("-123"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), -123);

  BOOST_CHECK(reader.parse("1.5e2"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), 150.0, 0.001);

  BOOST_CHECK(reader.parse("\"hello\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "hello");
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("\"hello\\nworld\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "hello\nworld");

  BOOST_CHECK(reader.parse("\"quote\\\"here\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "quote\"here");

  BOOST_CHECK(reader.parse("\"\\u0041\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "A");
}

BOOST_AUTO_TEST_CASE(TestArrayParsing) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("[]"));
  BOOST_CHECK(reader.getRoot().isArray());
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 0u);

  BOOST_CHECK(reader.parse("[0.285, 0.375, 0.385]"));
  const auto &arr = reader.getRoot();
  BOOST_CHECK_EQUAL(arr.size(), 3u);
  BOOST_CHECK_CLOSE(arr[0].asNumber(), 0.285, 0.001);
  BOOST_CHECK_CLOSE(arr[2].asNumber(), 0.385, 0.001);
}

// Test a realistic level script end to end
BOOST_AUTO_TEST_CASE(TestLevelDocument) {
  JsonReader reader;

  std::string levelJson = R"({
        "id": "level_001",
        "name": "First Pop",
        "enemyWaves": [
            {
                "id": "wave_1",
                "startTime": 0,
                "duration": 20,
                "spawnPattern": "two_small",
                "enemies": [
                    { "type": "basic", "sizeLevel": 3, "count": 2, "spawnInterval": 1.5 }
                ]
            }
        ],
        "balance": { "gravityMultiplier": 0.8 }
    })";

  BOOST_CHECK(reader.parse(levelJson));
  const auto &root = reader.getRoot();

  BOOST_CHECK_EQUAL(root["id"].asString(), "level_001");
  const auto &wave = root["enemyWaves"][0];
  BOOST_CHECK_EQUAL(wave["spawnPattern"].asString(), "two_small");
  BOOST_CHECK_EQUAL(wave["enemies"].size(), 1u);
  BOOST_CHECK_EQUAL(wave["enemies"][0]["count"].asInt(), 2);
  BOOST_CHECK_CLOSE(root["balance"]["gravityMultiplier"].asNumber(), 0.8, 0.001);
}

BOOST_AUTO_TEST_CASE(TestWhitespace) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("  \t\n  42  \r\n  "));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 42);

  BOOST_CHECK(reader.parse("{\n  \"a\" :\n  [ 1 ,\n 2 ]\n}"));
  BOOST_CHECK_EQUAL(reader.getRoot()["a"].size(), 2u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestInvalidJSON) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("hello"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("{\"key\": \"value\",}"));
  BOOST_CHECK(!reader.parse("[1, 2, 3,]"));
  BOOST_CHECK(!reader.parse("{\"key\": \"value\""));
  BOOST_CHECK(!reader.parse("[1, 2, 3"));
  BOOST_CHECK(!reader.parse("123."));
  BOOST_CHECK(!reader.parse("\"hello"));
  BOOST_CHECK(!reader.parse("\"hello\\x\""));
  BOOST_CHECK(!reader.parse("{42: \"value\"}"));
  BOOST_CHECK(!reader.parse("[1 2 3]"));
  BOOST_CHECK(!reader.parse("truee"));
}

// Test that a second root value is rejected
BOOST_AUTO_TEST_CASE(TestTrailingCharacters) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("42 43"));
  BOOST_CHECK(!reader.parse("{} x"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestErrorReportsPosition) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("{\n  \"gravity\": @\n}"));
  BOOST_CHECK(reader.getLastError().find("Line 2") != std::string::npos);
  BOOST_CHECK(reader.getLastError().find("Column") != std::string::npos);

  reader.clearError();
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestNestingLimit) {
  JsonReader reader;

  std::string deep(200, '[');
  deep += std::string(200, ']');
  BOOST_CHECK(!reader.parse(deep));

  std::string shallow(10, '[');
  shallow += std::string(10, ']');
  BOOST_CHECK(reader.parse(shallow));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderFileTests)

BOOST_AUTO_TEST_CASE(TestFileLoading) {
  std::string filename = "test_temp.json";
  {
    std::ofstream file(filename);
    file << R"({ "gravity": 500, "bounce": { "floor": 0.95, "wall": 0.9 } })";
  }

  JsonReader reader;
  BOOST_CHECK(reader.loadFromFile(filename));

  const auto &root = reader.getRoot();
  BOOST_CHECK_EQUAL(root["gravity"].asInt(), 500);
  BOOST_CHECK_CLOSE(root["bounce"]["wall"].asNumber(), 0.9, 0.001);

  std::remove(filename.c_str());
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("non_existent_file.json"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()
