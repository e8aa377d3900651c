#include <gtest/gtest.h>
#include "core/sqlwchar_utils.hpp"

using namespace mssql_mcp::core;

TEST(SqlWcharTest, AsciiIsNullTerminated) {
    auto wide = to_sqlwchar("abc");
    ASSERT_EQ(wide.size(), 4u);
    EXPECT_EQ(wide[0], 'a');
    EXPECT_EQ(wide[3], 0);
    EXPECT_EQ(from_sqlwchar(wide.data(), 3), "abc");
}

TEST(SqlWcharTest, BmpAndSupplementary) {
    // "é€😀": 2-, 3- and 4-byte UTF-8 sequences
    std::string text = "\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";
    auto wide = to_sqlwchar(text);
    ASSERT_EQ(wide.size(), 5u);
    EXPECT_EQ(wide[0], 0x00E9);
    EXPECT_EQ(wide[1], 0x20AC);
    EXPECT_EQ(wide[2], 0xD83D);
    EXPECT_EQ(wide[3], 0xDE00);
    EXPECT_EQ(from_sqlwchar(wide.data(), 4), text);
}

TEST(SqlWcharTest, MalformedInputIsReplaced) {
    auto wide = to_sqlwchar("a\xFF" "b");
    ASSERT_EQ(wide.size(), 4u);
    EXPECT_EQ(wide[1], 0xFFFD);
    EXPECT_EQ(wide[2], 'b');
}

TEST(SqlWcharTest, EmptyString) {
    auto wide = to_sqlwchar("");
    ASSERT_EQ(wide.size(), 1u);
    EXPECT_EQ(from_sqlwchar(wide.data(), 0), "");
}
