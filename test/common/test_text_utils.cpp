/**
 * @file test_text_utils.cpp
 * @brief UTF-8 helpers and script quoting
 */

#include <gtest/gtest.h>
#include "common/text_utils.h"

using namespace ocrlayer;

// ==================== UTF-8 ====================

TEST(TextUtils, SanitizeKeepsValidText) {
    EXPECT_EQ(text::SanitizeUtf8("abc\tdef\n"), "abc\tdef\n");
    EXPECT_EQ(text::SanitizeUtf8("\xc5\xbc\xc3\xb3\xc5\x82w"), "\xc5\xbc\xc3\xb3\xc5\x82w");
}

TEST(TextUtils, SanitizeReplacesBadBytesAndControls) {
    // U+FFFD is EF BF BD
    EXPECT_EQ(text::SanitizeUtf8("a\xff" "b"), "a\xef\xbf\xbd" "b");
    EXPECT_EQ(text::SanitizeUtf8("a\x01" "b"), "a\xef\xbf\xbd" "b");
    // Overlong encoding of '/'
    EXPECT_EQ(text::SanitizeUtf8("\xc0\xaf"), "\xef\xbf\xbd\xef\xbf\xbd");
}

TEST(TextUtils, IsValidUtf8) {
    EXPECT_TRUE(text::IsValidUtf8(""));
    EXPECT_TRUE(text::IsValidUtf8("\xe2\x82\xac"));
    EXPECT_FALSE(text::IsValidUtf8("\xe2\x82"));
    EXPECT_FALSE(text::IsValidUtf8("\xed\xa0\x80"));   // surrogate
}

TEST(TextUtils, Utf16RoundTrip) {
    const std::string input = "A\xe2\x82\xac\xf0\x9f\x98\x80";   // A, euro, emoji
    auto units = text::Utf8ToUtf16(input);
    ASSERT_EQ(units.size(), 5u);                                 // A, euro, surrogate pair, NUL
    EXPECT_EQ(units[0], 'A');
    EXPECT_EQ(units[1], 0x20AC);
    EXPECT_EQ(units[2], 0xD83D);
    EXPECT_EQ(units[3], 0xDE00);
    EXPECT_EQ(units[4], 0);

    std::vector<unsigned char> bytes;
    for (unsigned short u : units) {
        bytes.push_back(static_cast<unsigned char>(u & 0xFF));
        bytes.push_back(static_cast<unsigned char>(u >> 8));
    }
    EXPECT_EQ(text::Utf16LeToUtf8(bytes.data(), bytes.size()), input);
}

// ==================== Quoting ====================

TEST(TextUtils, QuoteScriptString) {
    EXPECT_EQ(text::QuoteScriptString("plain"), "\"plain\"");
    EXPECT_EQ(text::QuoteScriptString("a\"b\\c"), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(text::QuoteScriptString("x\ny"), "\"x\\012y\"");
    EXPECT_EQ(text::QuoteScriptString("\xc3\xa9"), "\"\xc3\xa9\"");
}

TEST(TextUtils, SmartRepr) {
    EXPECT_EQ(text::SmartRepr("file.pdf"), "'file.pdf'");
    EXPECT_EQ(text::SmartRepr("a'b"), "'a\\'b'");
    EXPECT_EQ(text::SmartRepr("a\x01"), "'a\\x01'");
}

TEST(TextUtils, TrimAndSplit) {
    EXPECT_EQ(text::Trim("  a b \n"), "a b");
    EXPECT_EQ(text::Trim(" \t "), "");
    EXPECT_EQ(text::Split("a,,b", ','), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(text::Split("", ','), (std::vector<std::string>{""}));
}
