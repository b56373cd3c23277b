#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

// ASCII-only; multi-byte UTF-8 sequences pass through untouched.
inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

inline bool isUtf8Continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

/**
 * @brief Byte length of the first maxChars code points of s.
 * @details Never splits a multi-byte sequence; returns s.size() when s is shorter.
 */
inline size_t utf8PrefixBytes(std::string_view s, size_t maxChars) {
    size_t chars = 0;
    size_t i = 0;
    while (i < s.size()) {
        if (chars == maxChars) return i;
        ++i;
        while (i < s.size() && isUtf8Continuation(static_cast<unsigned char>(s[i]))) ++i;
        ++chars;
    }
    return s.size();
}

inline size_t utf8Length(std::string_view s) {
    size_t chars = 0;
    for (char c : s) {
        if (!isUtf8Continuation(static_cast<unsigned char>(c))) ++chars;
    }
    return chars;
}

} // namespace CommonUtils
