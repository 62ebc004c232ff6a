// =============================================================================
// UTF-8 Utility Tests
// =============================================================================

#include <gtest/gtest.h>
#include "threnody/util/utf8.hpp"
#include <string>

using namespace threnody::util;

class Utf8Test : public ::testing::Test {};

TEST_F(Utf8Test, AsciiCountsBytewise) {
    EXPECT_TRUE(is_valid_utf8("abc"));
    EXPECT_EQ(codepoint_length("abc"), 3u);
    EXPECT_EQ(codepoint_length(""), 0u);
}

TEST_F(Utf8Test, MultibyteSequences) {
    // e-acute (2 bytes), euro sign (3 bytes), emoji (4 bytes)
    std::string text = "\xC3\xA9\xE2\x82\xAC\xF0\x9F\x95\xAF";
    EXPECT_TRUE(is_valid_utf8(text));
    EXPECT_EQ(codepoint_length(text), 3u);
}

TEST_F(Utf8Test, RejectsMalformedInput) {
    EXPECT_FALSE(is_valid_utf8("\xFF"));
    EXPECT_FALSE(is_valid_utf8("abc\xC3"));          // truncated
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));         // overlong slash
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));     // surrogate
    EXPECT_FALSE(is_valid_utf8("\xE2\x28\xA1"));     // bad continuation
}

TEST_F(Utf8Test, InvalidSequencesCountOnce) {
    EXPECT_EQ(codepoint_length("a\xFF" "b"), 3u);
    // Bad continuation: the lead byte counts alone, then "(" and the stray 0xA1
    EXPECT_EQ(codepoint_length("\xE2\x28\xA1"), 3u);
}

TEST_F(Utf8Test, TrimStripsAsciiWhitespace) {
    EXPECT_EQ(trim("  hello \t\n"), "hello");
    EXPECT_EQ(trim("hello"), "hello");
    EXPECT_EQ(trim(" \r\n "), "");
    EXPECT_EQ(trim(""), "");
}
