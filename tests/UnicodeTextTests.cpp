#include <gtest/gtest.h>

#include "UnicodeText.h"

TEST(UnicodeTextTest, ToLower_MapsNonAsciiLetters) {
    EXPECT_EQ(UnicodeText::toLower("\xC3\x9C" "BER"), "\xC3\xBC" "ber");
    EXPECT_EQ(UnicodeText::toLower("\xCE\x91\xCE\x98\xCE\x97\xCE\x9D\xCE\x91"), "\xCE\xB1\xCE\xB8\xCE\xB7\xCE\xBD\xCE\xB1");
    EXPECT_EQ(UnicodeText::toLower("AS64500 Net"), "as64500 net");
    EXPECT_EQ(UnicodeText::toLower(""), "");
}

TEST(UnicodeTextTest, ContainsLowered_IgnoresCaseOfHaystack) {
    EXPECT_TRUE(UnicodeText::containsLowered("Stra\xC3\x9F" "e \xC3\x96STERREICH", "\xC3\xB6sterreich"));
    EXPECT_TRUE(UnicodeText::containsLowered("anything", ""));
    EXPECT_FALSE(UnicodeText::containsLowered("\xC3\xBC" "ber", "uber"));
}
