// test/unit/test_utf8.cpp
// -----------------------------------------------------------

#include <gtest/gtest.h>
#include <string>

#include "util/utf8.hpp"

namespace {

namespace utf8 = piiguard::util::utf8;

TEST(Utf8Test, DecodesMultiByteSequences) {
    const std::string s = "K\xC3\xB6ln \xE2\x82\xAC \xF0\x9F\x99\x82";
    size_t pos = 0;
    EXPECT_EQ(utf8::decodeNext(s, pos), (char32_t)'K');
    EXPECT_EQ(utf8::decodeNext(s, pos), (char32_t)0xF6);
    EXPECT_EQ(pos, (size_t)3);

    const std::u32string cps = utf8::toUtf32(s);
    ASSERT_EQ(cps.size(), (size_t)8);
    EXPECT_EQ(cps[5], (char32_t)0x20AC);
    EXPECT_EQ(cps[7], (char32_t)0x1F642);
}

TEST(Utf8Test, InvalidBytesBecomeReplacementChar) {
    std::string truncated = "\xC3";
    size_t pos = 0;
    EXPECT_EQ(utf8::decodeNext(truncated, pos), utf8::REPLACEMENT_CHAR);
    EXPECT_EQ(pos, truncated.size());

    const std::u32string cps = utf8::toUtf32("\xFF" "a");
    ASSERT_EQ(cps.size(), (size_t)2);
    EXPECT_EQ(cps[0], utf8::REPLACEMENT_CHAR);
    EXPECT_EQ(cps[1], (char32_t)'a');
}

TEST(Utf8Test, LetterClasses) {
    EXPECT_TRUE(utf8::isUpper(U'M'));
    EXPECT_TRUE(utf8::isUpper(0xC4));   // Ä
    EXPECT_TRUE(utf8::isUpper(0x160));  // Š
    EXPECT_TRUE(utf8::isUpper(0x416));  // Ж
    EXPECT_FALSE(utf8::isUpper(0xDF));  // ß
    EXPECT_FALSE(utf8::isUpper(0xD7));  // ×
    EXPECT_FALSE(utf8::isUpper(U'm'));

    EXPECT_TRUE(utf8::isLetter(0xDF));
    EXPECT_TRUE(utf8::isLetter(0x107));  // ć
    EXPECT_FALSE(utf8::isLetter(U'1'));
    EXPECT_FALSE(utf8::isLetter(U'.'));
    EXPECT_FALSE(utf8::isLetter(utf8::REPLACEMENT_CHAR));
}

TEST(Utf8Test, TrimAndFoldCase) {
    EXPECT_EQ(utf8::trim(" \t Max \r\n"), "Max");
    EXPECT_EQ(utf8::trim("   "), "");
    EXPECT_EQ(utf8::foldCase("UNIVERSIT\xC3\x84T GmbH"), "universit\xC3\xA4t gmbh");
    EXPECT_EQ(utf8::foldCase("\xC3\x97"), "\xC3\x97");
}

} // namespace
