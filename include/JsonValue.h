#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Strict JSON value: null, bool, integer, number, string, array, object.
 * @details Objects keep insertion order; plan order and report layout are part
 * of the output contract.
 */
struct JsonValue {
    enum class Type { Null, Bool, Integer, Number, String, Array, Object };
    using Member = std::pair<std::string, JsonValue>;

    Type type = Type::Null;
    bool booleanValue = false;
    int64_t integerValue = 0;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::vector<Member> objectValue;

    static JsonValue null() { return JsonValue{}; }
    static JsonValue boolean(bool v);
    static JsonValue integer(int64_t v);
    static JsonValue number(double v);
    static JsonValue string(std::string v);
    static JsonValue array(std::vector<JsonValue> items = {});
    static JsonValue object();

    bool isNull() const noexcept { return type == Type::Null; }
    bool isBool() const noexcept { return type == Type::Bool; }
    bool isInteger() const noexcept { return type == Type::Integer; }
    bool isNumber() const noexcept { return type == Type::Number || type == Type::Integer; }
    bool isString() const noexcept { return type == Type::String; }
    bool isArray() const noexcept { return type == Type::Array; }
    bool isObject() const noexcept { return type == Type::Object; }

    double asDouble() const noexcept {
        return type == Type::Integer ? static_cast<double>(integerValue) : numberValue;
    }

    const JsonValue* find(const std::string& key) const;
    JsonValue* find(const std::string& key);

    /**
     * @brief Inserts or replaces a member, keeping the first insertion position.
     */
    JsonValue& set(const std::string& key, JsonValue value);
    void push(JsonValue value) { arrayValue.push_back(std::move(value)); }
    size_t size() const noexcept;

    /**
     * @brief Serializes to JSON text. Non-finite numbers are written as null.
     * @param indent 0 for compact output, otherwise spaces per nesting level.
     */
    std::string dump(int indent = 0) const;

    bool operator==(const JsonValue& other) const;
    bool operator!=(const JsonValue& other) const { return !(*this == other); }
};

/**
 * @brief Parses a complete JSON document.
 * @throws Augur::JsonException on malformed input or trailing content.
 */
JsonValue parseJsonText(const std::string& text);

std::string escapeJsonString(const std::string& value);
