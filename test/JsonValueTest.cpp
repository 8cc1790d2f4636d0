#include "AugurExceptions.h"
#include "JsonValue.h"

#include <catch2/catch.hpp>

#include <cmath>

TEST_CASE("JsonValue - objects keep insertion order", "[json]") {
    JsonValue obj = JsonValue::object();
    obj.set("b", JsonValue::integer(1));
    obj.set("a", JsonValue::string("x"));
    obj.set("b", JsonValue::boolean(true));
    REQUIRE(obj.size() == 2);
    CHECK(obj.objectValue[0].first == "b");
    CHECK(obj.find("b")->isBool());
    CHECK(obj.find("missing") == nullptr);
    CHECK(obj.dump() == R"({"b":true,"a":"x"})");
}

TEST_CASE("JsonValue - pretty printing", "[json]") {
    JsonValue obj = JsonValue::object();
    obj.set("items", JsonValue::array({JsonValue::integer(1), JsonValue::null()}));
    obj.set("empty", JsonValue::object());
    CHECK(obj.dump(2) == "{\n  \"items\": [\n    1,\n    null\n  ],\n  \"empty\": {}\n}");
}

TEST_CASE("JsonValue - numbers", "[json]") {
    CHECK(JsonValue::number(0.5).dump() == "0.5");
    CHECK(JsonValue::number(std::nan("")).dump() == "null");
    CHECK(JsonValue::integer(-42).dump() == "-42");
    CHECK(JsonValue::integer(3) == JsonValue::number(3.0));
    CHECK(JsonValue::number(3.5) != JsonValue::integer(3));
}

TEST_CASE("JsonValue - parsing", "[json]") {
    const JsonValue v = parseJsonText(R"( {"n": 12, "f": -1.5e2, "s": "a\"bé", "l": [true, false, null]} )");
    REQUIRE(v.isObject());
    CHECK(v.find("n")->isInteger());
    CHECK(v.find("n")->integerValue == 12);
    CHECK(v.find("f")->asDouble() == Approx(-150.0));
    CHECK(v.find("s")->stringValue == "a\"b\xc3\xa9");
    CHECK(v.find("l")->size() == 3);
    CHECK(parseJsonText(v.dump()) == v);
}

TEST_CASE("JsonValue - malformed documents", "[json]") {
    REQUIRE_THROWS_AS(parseJsonText("{\"a\": }"), Augur::JsonException);
    REQUIRE_THROWS_AS(parseJsonText("[1, 2"), Augur::JsonException);
    REQUIRE_THROWS_AS(parseJsonText("{} extra"), Augur::JsonException);
    REQUIRE_THROWS_AS(parseJsonText(""), Augur::JsonException);
}

TEST_CASE("JsonValue - string escaping", "[json]") {
    CHECK(escapeJsonString("line\nbreak\t\"q\"") == "line\\nbreak\\t\\\"q\\\"");
}
