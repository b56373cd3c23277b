#include "UnicodeText.h"

#include <unicode/locid.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>

namespace UnicodeText {

std::string toLower(std::string_view utf8) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
    u.toLower(icu::Locale::getRoot());
    std::string out;
    u.toUTF8String(out);
    return out;
}

bool containsLowered(std::string_view haystack, std::string_view needleLower) {
    if (needleLower.empty()) return true;
    return toLower(haystack).find(needleLower) != std::string::npos;
}

} // namespace UnicodeText
