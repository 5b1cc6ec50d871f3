#include <gtest/gtest.h>
#include "string_utils.hpp"

using namespace hilite::string_utils;

TEST(StringUtilsTest, StripAnsiRemovesCsiSequences) {
    EXPECT_EQ(strip_ansi("a\033[38;5;1mbc\033[0;0;0md"), "abcd");
    EXPECT_EQ(strip_ansi("\033[38;5;1m\033[48;5;2mx"), "x");
    EXPECT_EQ(strip_ansi("plain"), "plain");
    EXPECT_EQ(strip_ansi(""), "");
}

TEST(StringUtilsTest, StripAnsiKeepsLoneEscape) {
    EXPECT_EQ(strip_ansi("a\033b"), "a\033b");
}

TEST(StringUtilsTest, StripAnsiKeepsUtf8AfterSequence) {
    EXPECT_EQ(strip_ansi("\033[38;5;1m\xc3\xa9\033[0;0;0m!"), "\xc3\xa9!");
}

TEST(StringUtilsTest, StripAnsiKeepsSequenceInterruptedByHighBytes) {
    EXPECT_EQ(strip_ansi("\033[1\xc3\xa9x"), "\033[1\xc3\xa9x");
    EXPECT_EQ(strip_ansi("a\033[\xffm"), "a\033[\xffm");
}

TEST(StringUtilsTest, StripAnsiKeepsUnterminatedSequence) {
    EXPECT_EQ(strip_ansi("a\033[38;5"), "a\033[38;5");
}

TEST(StringUtilsTest, StripAndStartsWith) {
    EXPECT_EQ(strip("  a b \t\n"), "a b");
    EXPECT_EQ(strip("   "), "");
    EXPECT_TRUE(starts_with("--stress=5", "--stress="));
    EXPECT_FALSE(starts_with("-", "--"));
}
