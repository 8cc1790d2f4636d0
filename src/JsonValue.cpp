#include "JsonValue.h"

#include "AugurExceptions.h"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

JsonValue JsonValue::boolean(bool v) {
    JsonValue out;
    out.type = Type::Bool;
    out.booleanValue = v;
    return out;
}

JsonValue JsonValue::integer(int64_t v) {
    JsonValue out;
    out.type = Type::Integer;
    out.integerValue = v;
    return out;
}

JsonValue JsonValue::number(double v) {
    JsonValue out;
    out.type = Type::Number;
    out.numberValue = v;
    return out;
}

JsonValue JsonValue::string(std::string v) {
    JsonValue out;
    out.type = Type::String;
    out.stringValue = std::move(v);
    return out;
}

JsonValue JsonValue::array(std::vector<JsonValue> items) {
    JsonValue out;
    out.type = Type::Array;
    out.arrayValue = std::move(items);
    return out;
}

JsonValue JsonValue::object() {
    JsonValue out;
    out.type = Type::Object;
    return out;
}

const JsonValue* JsonValue::find(const std::string& key) const {
    if (!isObject()) return nullptr;
    for (const auto& member : objectValue) {
        if (member.first == key) return &member.second;
    }
    return nullptr;
}

JsonValue* JsonValue::find(const std::string& key) {
    if (!isObject()) return nullptr;
    for (auto& member : objectValue) {
        if (member.first == key) return &member.second;
    }
    return nullptr;
}

JsonValue& JsonValue::set(const std::string& key, JsonValue value) {
    if (type != Type::Object) {
        type = Type::Object;
        objectValue.clear();
    }
    if (JsonValue* existing = find(key)) {
        *existing = std::move(value);
        return *existing;
    }
    objectValue.emplace_back(key, std::move(value));
    return objectValue.back().second;
}

size_t JsonValue::size() const noexcept {
    if (isArray()) return arrayValue.size();
    if (isObject()) return objectValue.size();
    return 0;
}

std::string escapeJsonString(const std::string& value) {
    std::ostringstream out;
    for (char c : value) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    out << c;
                }
                break;
        }
    }
    return out.str();
}

namespace {
std::string formatNumber(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream out;
    out << std::setprecision(15) << value;
    return out.str();
}

void dumpInto(const JsonValue& v, std::ostringstream& out, int indent, int depth) {
    const auto newline = [&](int level) {
        if (indent <= 0) return;
        out << '\n' << std::string(static_cast<size_t>(indent * level), ' ');
    };

    switch (v.type) {
        case JsonValue::Type::Null:
            out << "null";
            return;
        case JsonValue::Type::Bool:
            out << (v.booleanValue ? "true" : "false");
            return;
        case JsonValue::Type::Integer:
            out << v.integerValue;
            return;
        case JsonValue::Type::Number:
            out << formatNumber(v.numberValue);
            return;
        case JsonValue::Type::String:
            out << '"' << escapeJsonString(v.stringValue) << '"';
            return;
        case JsonValue::Type::Array: {
            if (v.arrayValue.empty()) {
                out << "[]";
                return;
            }
            out << '[';
            for (size_t i = 0; i < v.arrayValue.size(); ++i) {
                if (i > 0) out << ',';
                newline(depth + 1);
                dumpInto(v.arrayValue[i], out, indent, depth + 1);
            }
            newline(depth);
            out << ']';
            return;
        }
        case JsonValue::Type::Object: {
            if (v.objectValue.empty()) {
                out << "{}";
                return;
            }
            out << '{';
            for (size_t i = 0; i < v.objectValue.size(); ++i) {
                if (i > 0) out << ',';
                newline(depth + 1);
                out << '"' << escapeJsonString(v.objectValue[i].first) << "\":";
                if (indent > 0) out << ' ';
                dumpInto(v.objectValue[i].second, out, indent, depth + 1);
            }
            newline(depth);
            out << '}';
            return;
        }
    }
}

class JsonParser {
public:
    explicit JsonParser(const std::string& source) : text(source) {}

    JsonValue parse() {
        skipWhitespace();
        JsonValue value = parseValue();
        skipWhitespace();
        if (position != text.size()) {
            throw Augur::JsonException("Unexpected trailing JSON content");
        }
        return value;
    }

private:
    const std::string& text;
    size_t position = 0;
    int depth = 0;

    static constexpr int kMaxDepth = 512;

    void skipWhitespace() {
        while (position < text.size() && std::isspace(static_cast<unsigned char>(text[position])) != 0) {
            ++position;
        }
    }

    char peek() const {
        if (position >= text.size()) {
            throw Augur::JsonException("Unexpected end of JSON input");
        }
        return text[position];
    }

    char take() {
        if (position >= text.size()) {
            throw Augur::JsonException("Unexpected end of JSON input");
        }
        return text[position++];
    }

    void expect(char expected) {
        const char value = take();
        if (value != expected) {
            throw Augur::JsonException(std::string("Expected JSON character '") + expected + "'");
        }
    }

    JsonValue parseValue() {
        skipWhitespace();
        const char c = peek();
        if (c == '{' || c == '[') {
            if (++depth > kMaxDepth) throw Augur::JsonException("JSON nesting too deep");
            JsonValue nested = (c == '{') ? parseObject() : parseArray();
            --depth;
            return nested;
        }
        if (c == '"') return parseString();
        if (c == 't' || c == 'f') return parseBoolean();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber();
        throw Augur::JsonException("Invalid JSON token");
    }

    JsonValue parseObject() {
        JsonValue object = JsonValue::object();

        expect('{');
        skipWhitespace();
        if (peek() == '}') {
            take();
            return object;
        }

        while (true) {
            skipWhitespace();
            JsonValue key = parseString();
            skipWhitespace();
            expect(':');
            skipWhitespace();
            JsonValue value = parseValue();
            object.set(key.stringValue, std::move(value));

            skipWhitespace();
            const char next = take();
            if (next == '}') {
                break;
            }
            if (next != ',') {
                throw Augur::JsonException("Expected ',' or '}' in JSON object");
            }
        }

        return object;
    }

    JsonValue parseArray() {
        JsonValue array = JsonValue::array();

        expect('[');
        skipWhitespace();
        if (peek() == ']') {
            take();
            return array;
        }

        while (true) {
            array.arrayValue.push_back(parseValue());
            skipWhitespace();
            const char next = take();
            if (next == ']') {
                break;
            }
            if (next != ',') {
                throw Augur::JsonException("Expected ',' or ']' in JSON array");
            }
        }

        return array;
    }

    void appendUtf8(std::string& out, unsigned codePoint) {
        if (codePoint < 0x80) {
            out.push_back(static_cast<char>(codePoint));
        } else if (codePoint < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
            out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
            out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
        }
    }

    unsigned parseHex4() {
        unsigned value = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = take();
            value <<= 4;
            if (h >= '0' && h <= '9') value |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') value |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') value |= static_cast<unsigned>(h - 'A' + 10);
            else throw Augur::JsonException("Invalid \\u escape in JSON string");
        }
        return value;
    }

    JsonValue parseString() {
        JsonValue str = JsonValue::string("");

        expect('"');
        while (true) {
            const char c = take();
            if (c == '"') break;
            if (c == '\\') {
                const char escaped = take();
                switch (escaped) {
                    case '"': str.stringValue.push_back('"'); break;
                    case '\\': str.stringValue.push_back('\\'); break;
                    case '/': str.stringValue.push_back('/'); break;
                    case 'b': str.stringValue.push_back('\b'); break;
                    case 'f': str.stringValue.push_back('\f'); break;
                    case 'n': str.stringValue.push_back('\n'); break;
                    case 'r': str.stringValue.push_back('\r'); break;
                    case 't': str.stringValue.push_back('\t'); break;
                    case 'u': {
                        unsigned cp = parseHex4();
                        if (cp >= 0xD800 && cp <= 0xDBFF) {
                            // Surrogate pairs collapse to the replacement character.
                            if (position + 6 <= text.size() && text[position] == '\\' && text[position + 1] == 'u') {
                                position += 2;
                                parseHex4();
                            }
                            cp = 0xFFFD;
                        }
                        appendUtf8(str.stringValue, cp);
                        break;
                    }
                    default:
                        throw Augur::JsonException("Unsupported escaped character in JSON string");
                }
                continue;
            }
            str.stringValue.push_back(c);
        }

        return str;
    }

    JsonValue parseBoolean() {
        if (text.compare(position, 4, "true") == 0) {
            position += 4;
            return JsonValue::boolean(true);
        }
        if (text.compare(position, 5, "false") == 0) {
            position += 5;
            return JsonValue::boolean(false);
        }
        throw Augur::JsonException("Invalid JSON boolean value");
    }

    JsonValue parseNull() {
        if (text.compare(position, 4, "null") != 0) {
            throw Augur::JsonException("Invalid JSON null value");
        }
        position += 4;
        return JsonValue::null();
    }

    JsonValue parseNumber() {
        const size_t start = position;
        bool integral = true;
        if (peek() == '-') take();

        if (peek() == '0') {
            take();
        } else {
            while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
                ++position;
            }
        }

        if (position < text.size() && text[position] == '.') {
            integral = false;
            ++position;
            while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
                ++position;
            }
        }

        if (position < text.size() && (text[position] == 'e' || text[position] == 'E')) {
            integral = false;
            ++position;
            if (position < text.size() && (text[position] == '+' || text[position] == '-')) {
                ++position;
            }
            while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
                ++position;
            }
        }

        const std::string token = text.substr(start, position - start);
        if (token.empty() || token == "-") {
            throw Augur::JsonException("Invalid JSON number");
        }

        try {
            if (integral) {
                size_t used = 0;
                const long long parsed = std::stoll(token, &used);
                if (used == token.size()) return JsonValue::integer(static_cast<int64_t>(parsed));
            }
            return JsonValue::number(std::stod(token));
        } catch (const std::out_of_range&) {
            return JsonValue::number(std::stod(token));
        } catch (const std::exception&) {
            throw Augur::JsonException("Failed to parse JSON number: " + token);
        }
    }
};
} // namespace

std::string JsonValue::dump(int indent) const {
    std::ostringstream out;
    dumpInto(*this, out, indent, 0);
    return out.str();
}

bool JsonValue::operator==(const JsonValue& other) const {
    if (isNumber() && other.isNumber()) {
        if (isInteger() && other.isInteger()) return integerValue == other.integerValue;
        return asDouble() == other.asDouble();
    }
    if (type != other.type) return false;
    switch (type) {
        case Type::Null: return true;
        case Type::Bool: return booleanValue == other.booleanValue;
        case Type::String: return stringValue == other.stringValue;
        case Type::Array: return arrayValue == other.arrayValue;
        case Type::Object: return objectValue == other.objectValue;
        default: return false;
    }
}

JsonValue parseJsonText(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}
