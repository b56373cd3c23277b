#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// Minimal JSON model used for reading registry dumps and writing API payloads.
struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };

    Type type = Type::Null;
    bool booleanValue = false;
    double numberValue = 0.0;
    // Set when the number token had no fraction or exponent and fits in int64_t.
    bool numberIsInteger = false;
    int64_t integerValue = 0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::unordered_map<std::string, JsonValue> objectValue;

    bool isNull() const noexcept { return type == Type::Null; }
    bool isObject() const noexcept { return type == Type::Object; }
    bool isArray() const noexcept { return type == Type::Array; }
    bool isString() const noexcept { return type == Type::String; }
    bool isNumber() const noexcept { return type == Type::Number; }
    bool isInteger() const noexcept { return type == Type::Number && numberIsInteger; }

    const JsonValue* find(const std::string& key) const {
        if (!isObject()) return nullptr;
        auto it = objectValue.find(key);
        if (it == objectValue.end()) return nullptr;
        return &it->second;
    }

    std::string dump() const;
};

namespace JsonUtils {

/**
 * @brief Parses a complete JSON document.
 * @details A leading UTF-8 BOM is skipped. \\uXXXX escapes, including surrogate
 * pairs, are re-encoded as UTF-8.
 * @throws NetViz::JsonParseException with the byte offset of the first error.
 */
JsonValue parse(const std::string& text);

std::string escapeString(const std::string& value);
std::string formatDouble(double value);

} // namespace JsonUtils
