#pragma once

#include <string>
#include <string_view>

// Locale-independent Unicode case mapping over UTF-8 text (ICU root locale).
namespace UnicodeText {

/**
 * @brief Full Unicode lowercase of a UTF-8 string.
 * @details Ill-formed sequences come back as U+FFFD.
 */
std::string toLower(std::string_view utf8);

/**
 * @brief Case-insensitive substring test under Unicode lowercasing.
 * @param needleLower needle already passed through toLower by the caller.
 */
bool containsLowered(std::string_view haystack, std::string_view needleLower);

} // namespace UnicodeText
