/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string utility functions
 */

#include <gtest/gtest.h>
#include <person/utils/string_utils.h>

#include <ios>

using namespace person::utils;

class StringUtilsTest : public ::testing::Test {
protected:
    // Test setup if needed
};

// trim tests
TEST_F(StringUtilsTest, Trim_LeadingSpaces) {
    EXPECT_EQ(trim("   hello"), "hello");
}

TEST_F(StringUtilsTest, Trim_TrailingSpaces) {
    EXPECT_EQ(trim("hello   "), "hello");
}

TEST_F(StringUtilsTest, Trim_BothEnds) {
    EXPECT_EQ(trim("   hello   "), "hello");
}

TEST_F(StringUtilsTest, Trim_InnerSpacesKept) {
    EXPECT_EQ(trim("  Paco de Luc\xC3\xAD" "a "), "Paco de Luc\xC3\xAD" "a");
}

TEST_F(StringUtilsTest, Trim_OnlySpaces) {
    EXPECT_EQ(trim("     "), "");
}

TEST_F(StringUtilsTest, Trim_Empty) {
    EXPECT_EQ(trim(""), "");
}

TEST_F(StringUtilsTest, Trim_TabsAndNewlines) {
    EXPECT_EQ(trim("\t\nhello\r\n"), "hello");
}

// isBlank tests
TEST_F(StringUtilsTest, IsBlank_Empty) {
    EXPECT_TRUE(isBlank(""));
}

TEST_F(StringUtilsTest, IsBlank_WhitespaceOnly) {
    EXPECT_TRUE(isBlank("  "));
    EXPECT_TRUE(isBlank(" \t\r\n\v\f"));
}

TEST_F(StringUtilsTest, IsBlank_Text) {
    EXPECT_FALSE(isBlank("a"));
    EXPECT_FALSE(isBlank("  a  "));
}

TEST_F(StringUtilsTest, IsBlank_AgreesWithTrim) {
    for (const std::string s : {"", " ", "x", " x ", "\t", "\tx"}) {
        EXPECT_EQ(isBlank(s), trim(s).empty()) << "'" << s << "'";
    }
}

// Unicode whitespace tests
TEST_F(StringUtilsTest, IsWhitespace_AsciiControls) {
    for (char32_t cp : {U'\t', U'\n', U'\v', U'\f', U'\r', U' '}) {
        EXPECT_TRUE(isWhitespace(cp)) << static_cast<unsigned>(cp);
    }
    EXPECT_FALSE(isWhitespace(U'a'));
    EXPECT_FALSE(isWhitespace(U'\0'));
    EXPECT_FALSE(isWhitespace(0x85));  // NEL is a control, not whitespace
}

TEST_F(StringUtilsTest, IsWhitespace_InformationSeparators) {
    for (char32_t cp = 0x1C; cp <= 0x1F; ++cp) {
        EXPECT_TRUE(isWhitespace(cp)) << std::hex << static_cast<unsigned>(cp);
    }
}

TEST_F(StringUtilsTest, IsWhitespace_SpaceSeparators) {
    for (char32_t cp : {0x1680, 0x2000, 0x2001, 0x2002, 0x2003, 0x2004, 0x2005, 0x2006,
                        0x2008, 0x2009, 0x200A, 0x205F, 0x3000}) {
        EXPECT_TRUE(isWhitespace(cp)) << std::hex << static_cast<unsigned>(cp);
    }
}

TEST_F(StringUtilsTest, IsWhitespace_LineAndParagraphSeparators) {
    EXPECT_TRUE(isWhitespace(0x2028));
    EXPECT_TRUE(isWhitespace(0x2029));
}

TEST_F(StringUtilsTest, IsWhitespace_NoBreakSpacesExcluded) {
    EXPECT_FALSE(isWhitespace(0x00A0));
    EXPECT_FALSE(isWhitespace(0x2007));
    EXPECT_FALSE(isWhitespace(0x202F));
    EXPECT_FALSE(isWhitespace(0x200B));  // zero width space
}

TEST_F(StringUtilsTest, Trim_UnicodeWhitespace) {
    EXPECT_EQ(trim("\xE3\x80\x80hello\xE2\x80\xA8"), "hello");        // U+3000, U+2028
    EXPECT_EQ(trim("\xE2\x80\x83 a b \x1F"), "a b");                    // U+2003, U+001F
}

TEST_F(StringUtilsTest, IsBlank_UnicodeWhitespaceOnly) {
    EXPECT_TRUE(isBlank("\xE3\x80\x80"));                  // U+3000
    EXPECT_TRUE(isBlank("\xE2\x80\x83\xE2\x80\x8A"));    // U+2003 U+200A
    EXPECT_TRUE(isBlank("\xE2\x80\xA8\xE2\x80\xA9"));    // U+2028 U+2029
    EXPECT_TRUE(isBlank("\xE1\x9A\x80\xE2\x81\x9F"));    // U+1680 U+205F
    EXPECT_TRUE(isBlank("\x1C\x1D\x1E\x1F"));
}

TEST_F(StringUtilsTest, IsBlank_NoBreakSpaceIsContent) {
    EXPECT_FALSE(isBlank("\xC2\xA0"));          // U+00A0
    EXPECT_FALSE(isBlank("\xE2\x80\x87"));      // U+2007
    EXPECT_FALSE(isBlank(" \xE2\x80\xAF "));    // U+202F
    EXPECT_EQ(trim(" \xC2\xA0 "), "\xC2\xA0");
}

TEST_F(StringUtilsTest, IsBlank_InvalidUtf8IsContent) {
    EXPECT_FALSE(isBlank("\xFF"));
    EXPECT_FALSE(isBlank("\xE3\x80"));           // truncated U+3000
    EXPECT_FALSE(isBlank("\xC0\xA0"));           // overlong space
    EXPECT_EQ(trim(" \x80 "), "\x80");
}

// join tests
TEST_F(StringUtilsTest, Join_Empty) {
    EXPECT_EQ(join({}, ", "), "");
}

TEST_F(StringUtilsTest, Join_Single) {
    EXPECT_EQ(join({"a"}, ", "), "a");
}

TEST_F(StringUtilsTest, Join_Multiple) {
    EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
}
