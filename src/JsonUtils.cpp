#include "JsonUtils.h"

#include "NetVizExceptions.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace {

void appendUtf8(std::string& out, uint32_t codePoint) {
    if (codePoint < 0x80) {
        out.push_back(static_cast<char>(codePoint));
    } else if (codePoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else if (codePoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
}

class JsonParser {
public:
    explicit JsonParser(const std::string& source) : text(source) {}

    JsonValue parse() {
        skipBOM();
        skipWhitespace();
        JsonValue value = parseValue();
        skipWhitespace();
        if (position != text.size()) {
            fail("Unexpected trailing JSON content");
        }
        return value;
    }

private:
    static constexpr size_t kMaxDepth = 512;

    const std::string& text;
    size_t position = 0;
    size_t depth = 0;

    [[noreturn]] void fail(const std::string& message) const {
        throw NetViz::JsonParseException(message, position);
    }

    void skipBOM() {
        if (text.size() >= 3 &&
            static_cast<unsigned char>(text[0]) == 0xEF &&
            static_cast<unsigned char>(text[1]) == 0xBB &&
            static_cast<unsigned char>(text[2]) == 0xBF) {
            position = 3;
        }
    }

    void skipWhitespace() {
        while (position < text.size()) {
            const char c = text[position];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++position;
        }
    }

    char peek() const {
        if (position >= text.size()) {
            fail("Unexpected end of JSON input");
        }
        return text[position];
    }

    char take() {
        if (position >= text.size()) {
            fail("Unexpected end of JSON input");
        }
        return text[position++];
    }

    void expect(char expected) {
        if (peek() != expected) {
            fail(std::string("Expected JSON character '") + expected + "'");
        }
        ++position;
    }

    JsonValue parseValue() {
        skipWhitespace();
        const char c = peek();
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == '"') return parseString();
        if (c == 't' || c == 'f') return parseBoolean();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber();
        fail("Invalid JSON token");
    }

    void enterContainer() {
        if (++depth > kMaxDepth) {
            fail("JSON nesting too deep");
        }
    }

    JsonValue parseObject() {
        JsonValue object;
        object.type = JsonValue::Type::Object;

        enterContainer();
        expect('{');
        skipWhitespace();
        if (peek() == '}') {
            take();
            --depth;
            return object;
        }

        while (true) {
            skipWhitespace();
            if (peek() != '"') {
                fail("Expected string key in JSON object");
            }
            JsonValue key = parseString();
            skipWhitespace();
            expect(':');
            JsonValue value = parseValue();
            // Duplicate keys: last one wins.
            object.objectValue[key.stringValue] = std::move(value);

            skipWhitespace();
            const char next = peek();
            if (next == '}') {
                take();
                break;
            }
            if (next != ',') {
                fail("Expected ',' or '}' in JSON object");
            }
            take();
        }

        --depth;
        return object;
    }

    JsonValue parseArray() {
        JsonValue array;
        array.type = JsonValue::Type::Array;

        enterContainer();
        expect('[');
        skipWhitespace();
        if (peek() == ']') {
            take();
            --depth;
            return array;
        }

        while (true) {
            array.arrayValue.push_back(parseValue());
            skipWhitespace();
            const char next = peek();
            if (next == ']') {
                take();
                break;
            }
            if (next != ',') {
                fail("Expected ',' or ']' in JSON array");
            }
            take();
        }

        --depth;
        return array;
    }

    uint32_t parseHex4() {
        if (position + 4 > text.size()) {
            fail("Truncated \\u escape in JSON string");
        }
        uint32_t value = 0;
        for (size_t i = 0; i < 4; ++i) {
            const char c = text[position];
            value <<= 4;
            if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
            else fail("Invalid hex digit in \\u escape");
            ++position;
        }
        return value;
    }

    void parseUnicodeEscape(std::string& out) {
        uint32_t codePoint = parseHex4();
        if (codePoint >= 0xD800 && codePoint <= 0xDBFF) {
            if (position + 2 > text.size() || text[position] != '\\' || text[position + 1] != 'u') {
                fail("Unpaired high surrogate in JSON string");
            }
            position += 2;
            const uint32_t low = parseHex4();
            if (low < 0xDC00 || low > 0xDFFF) {
                fail("Invalid low surrogate in JSON string");
            }
            codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (low - 0xDC00);
        } else if (codePoint >= 0xDC00 && codePoint <= 0xDFFF) {
            fail("Unpaired low surrogate in JSON string");
        }
        appendUtf8(out, codePoint);
    }

    JsonValue parseString() {
        JsonValue str;
        str.type = JsonValue::Type::String;

        expect('"');
        while (true) {
            const char c = take();
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) {
                --position;
                fail("Unescaped control character in JSON string");
            }
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
                    case 'u': parseUnicodeEscape(str.stringValue); break;
                    default:
                        --position;
                        fail("Unsupported escaped character in JSON string");
                }
                continue;
            }
            str.stringValue.push_back(c);
        }

        return str;
    }

    JsonValue parseBoolean() {
        JsonValue value;
        value.type = JsonValue::Type::Bool;
        if (text.compare(position, 4, "true") == 0) {
            value.booleanValue = true;
            position += 4;
            return value;
        }
        if (text.compare(position, 5, "false") == 0) {
            value.booleanValue = false;
            position += 5;
            return value;
        }
        fail("Invalid JSON boolean value");
    }

    JsonValue parseNull() {
        if (text.compare(position, 4, "null") != 0) {
            fail("Invalid JSON null value");
        }
        position += 4;
        return JsonValue{};
    }

    bool atDigit() const {
        return position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0;
    }

    JsonValue parseNumber() {
        const size_t start = position;
        bool integral = true;
        if (peek() == '-') take();

        if (!atDigit()) {
            fail("Invalid JSON number");
        }
        if (text[position] == '0') {
            ++position;
        } else {
            while (atDigit()) ++position;
        }

        if (position < text.size() && text[position] == '.') {
            integral = false;
            ++position;
            if (!atDigit()) fail("Expected digit after decimal point");
            while (atDigit()) ++position;
        }

        if (position < text.size() && (text[position] == 'e' || text[position] == 'E')) {
            integral = false;
            ++position;
            if (position < text.size() && (text[position] == '+' || text[position] == '-')) {
                ++position;
            }
            if (!atDigit()) fail("Expected digit in exponent");
            while (atDigit()) ++position;
        }

        const std::string token = text.substr(start, position - start);

        JsonValue number;
        number.type = JsonValue::Type::Number;
        // Out of range: strtod gives +-HUGE_VAL on overflow, 0 or a subnormal on underflow.
        char* end = nullptr;
        number.numberValue = std::strtod(token.c_str(), &end);
        if (end != token.c_str() + token.size()) {
            throw NetViz::JsonParseException("Failed to parse JSON number", start);
        }

        if (integral) {
            int64_t parsed = 0;
            const char* first = token.data();
            const char* last = token.data() + token.size();
            const auto result = std::from_chars(first, last, parsed);
            if (result.ec == std::errc() && result.ptr == last) {
                number.numberIsInteger = true;
                number.integerValue = parsed;
            }
        }
        return number;
    }
};

} // namespace

std::string JsonValue::dump() const {
    switch (type) {
        case Type::Null:
            return "null";
        case Type::Bool:
            return booleanValue ? "true" : "false";
        case Type::Number:
            if (numberIsInteger) return std::to_string(integerValue);
            return JsonUtils::formatDouble(numberValue);
        case Type::String:
            return "\"" + JsonUtils::escapeString(stringValue) + "\"";
        case Type::Array: {
            std::ostringstream out;
            out << '[';
            for (size_t i = 0; i < arrayValue.size(); ++i) {
                if (i > 0) out << ',';
                out << arrayValue[i].dump();
            }
            out << ']';
            return out.str();
        }
        case Type::Object: {
            std::ostringstream out;
            out << '{';
            bool first = true;
            for (const auto& kv : objectValue) {
                if (!first) out << ',';
                first = false;
                out << '"' << JsonUtils::escapeString(kv.first) << "\":" << kv.second.dump();
            }
            out << '}';
            return out.str();
        }
    }
    return "null";
}

namespace JsonUtils {

JsonValue parse(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}

std::string escapeString(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    return out;
}

std::string formatDouble(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream out;
    out << std::setprecision(15) << value;
    return out.str();
}

} // namespace JsonUtils
