#include "StringUtils.h"

#include <gtest/gtest.h>

TEST(StringUtilsTest, ToLowerAndTrim) {
    EXPECT_EQ(ToLower("Cluely Helper (GPU)"), "cluely helper (gpu)");
    EXPECT_EQ(Trim("  \tchrome 1234\r\n"), "chrome 1234");
    EXPECT_EQ(Trim(" \n "), "");
}

TEST(StringUtilsTest, SplitWhitespaceCollapsesRuns) {
    std::vector<std::string> tokens = SplitWhitespace("chrome   1234 \t user");

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "chrome");
    EXPECT_EQ(tokens[1], "1234");
    EXPECT_EQ(tokens[2], "user");
}

TEST(StringUtilsTest, ParseIntRejectsPartialNumbers) {
    int value = -1;

    EXPECT_TRUE(ParseInt("443", value));
    EXPECT_EQ(value, 443);
    EXPECT_FALSE(ParseInt("443abc", value));
    EXPECT_FALSE(ParseInt("", value));
    EXPECT_FALSE(ParseInt("99999999999", value));
}

TEST(StringUtilsTest, EscapeJsonHandlesQuotesAndControlCharacters) {
    EXPECT_EQ(EscapeJson("say \"hi\"\\"), "say \\\"hi\\\"\\\\");
    EXPECT_EQ(EscapeJson("a\nb"), "a\\nb");
    EXPECT_EQ(EscapeJson(std::string("\x01", 1)), "\\u0001");
}
