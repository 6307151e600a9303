#include <gtest/gtest.h>

#include "utils/string_utils.hpp"

namespace jukebox {
namespace {

using namespace string_utils;

TEST(StringUtilsTest, TrimAndLower) {
    EXPECT_EQ(trim("  hello \t\n"), "hello");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("MiXeD"), "mixed");
}

TEST(StringUtilsTest, SplitKeepsEmptyFields) {
    auto parts = split("a,,b", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(join(parts, "|"), "a||b");
}

TEST(StringUtilsTest, UrlDetection) {
    EXPECT_TRUE(is_url("https://youtu.be/abc"));
    EXPECT_TRUE(is_url(" HTTP://example.com "));
    EXPECT_FALSE(is_url("never gonna give you up"));
    EXPECT_FALSE(is_url("https://example.com/a b"));
    EXPECT_FALSE(is_url("spotify:track:123"));
}

// The quoted value must survive /bin/sh untouched
TEST(StringUtilsTest, ShellQuote) {
    EXPECT_EQ(shell_quote("plain"), "'plain'");
    EXPECT_EQ(shell_quote("it's; rm -rf /"), "'it'\\''s; rm -rf /'");
}

TEST(StringUtilsTest, EscapeMarkdown) {
    EXPECT_EQ(escape_markdown("*bold* _it_"), "\\*bold\\* \\_it\\_");
}

TEST(StringUtilsTest, Truncate) {
    EXPECT_EQ(truncate("short", 10), "short");
    EXPECT_EQ(truncate("a very long title", 10), "a very ...");
    EXPECT_EQ(truncate("abcdef", 2), "..");
}

} // namespace
} // namespace jukebox
