// test/test_globpattern.cpp
#include "gtest/gtest.h"

#include "../src/utils/GlobPattern.hpp"

TEST(GlobPatternTest, LiteralMatchesWholeKey) {
    GlobPattern glob("user:1");
    EXPECT_TRUE(glob.isLiteral());
    EXPECT_TRUE(glob.matches("user:1"));
    EXPECT_FALSE(glob.matches("user:10"));
    EXPECT_FALSE(glob.matches("xuser:1"));
}

TEST(GlobPatternTest, StarMatchesAnyRun) {
    EXPECT_TRUE(GlobPattern::match("user:*", "user:"));
    EXPECT_TRUE(GlobPattern::match("user:*", "user:42:profile"));
    EXPECT_TRUE(GlobPattern::match("*:profile", "user:42:profile"));
    EXPECT_TRUE(GlobPattern::match("a*b*c", "aXXbYYc"));
    EXPECT_FALSE(GlobPattern::match("a*b*c", "aXXbYY"));
    EXPECT_TRUE(GlobPattern::match("*", ""));
}

TEST(GlobPatternTest, QuestionMarkMatchesOneCharacter) {
    EXPECT_TRUE(GlobPattern::match("user:?", "user:1"));
    EXPECT_FALSE(GlobPattern::match("user:?", "user:12"));
    EXPECT_FALSE(GlobPattern::match("user:?", "user:"));
}

TEST(GlobPatternTest, CaseSensitive) {
    EXPECT_FALSE(GlobPattern::match("User:*", "user:1"));
}

TEST(GlobPatternTest, BracketsAreLiteral) {
    EXPECT_TRUE(GlobPattern::match("list[0]", "list[0]"));
    EXPECT_FALSE(GlobPattern::match("list[0]", "list0"));
    EXPECT_TRUE(GlobPattern("list[0]").isLiteral());
}

TEST(GlobPatternTest, StarInKeyIsMatchedByStar) {
    EXPECT_TRUE(GlobPattern::match("a*", "a*b"));
    EXPECT_TRUE(GlobPattern::match("*", "*"));
}

TEST(GlobPatternTest, RedisMatchEscapesMetacharacters) {
    EXPECT_EQ(GlobPattern("user:*").toRedisMatch(), "user:*");
    EXPECT_EQ(GlobPattern("list[0]:x").toRedisMatch(), "list\\[0\\]:x");
    EXPECT_EQ(GlobPattern("a\\b").toRedisMatch(), "a\\\\b");
}

TEST(GlobPatternTest, QuestionMarkMatchesOneUtf8Character) {
    EXPECT_TRUE(GlobPattern::match("?", "\xC3\xBC"));             // u-umlaut, 2 bytes
    EXPECT_TRUE(GlobPattern::match("k:?", "k:\xE2\x82\xAC"));     // euro sign, 3 bytes
    EXPECT_TRUE(GlobPattern::match("??", "a\xF0\x9F\x98\x80"));  // 'a' + emoji, 4 bytes
    EXPECT_FALSE(GlobPattern::match("??", "\xC3\xBC"));
    EXPECT_FALSE(GlobPattern::match("?", "\xC3\xBC\xC3\xBC"));
}

TEST(GlobPatternTest, StarBacktracksOverWholeCharacters) {
    EXPECT_TRUE(GlobPattern::match("*?", "\xC3\xBC"));
    EXPECT_TRUE(GlobPattern::match("*?x", "a\xC3\xBCx"));
    EXPECT_TRUE(GlobPattern::match("\xC3\xBC*", "\xC3\xBC" "ber"));
    EXPECT_FALSE(GlobPattern::match("*?\xC3\xBC", "\xC3\xBC"));
}

TEST(GlobPatternTest, RedisMatchWidensQuestionMark) {
    GlobPattern glob("user:?");
    EXPECT_EQ(glob.toRedisMatch(), "user:*");
    // The widened pattern over-matches; matches() keeps the original meaning
    EXPECT_TRUE(glob.matches("user:\xC3\xBC"));
    EXPECT_FALSE(glob.matches("user:12"));
}
