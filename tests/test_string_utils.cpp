#include "utils/StringUtils.hpp"

#include <gtest/gtest.h>

namespace LogSeg::test {

using namespace LogSeg::Utils;

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(trim("  hello \t\r"), "hello");
    EXPECT_EQ(ltrim("  hello "), "hello ");
    EXPECT_EQ(rtrim("  hello "), "  hello");
    EXPECT_TRUE(trim(" \t ").empty());
}

TEST(StringUtilsTest, UnicodeSpacePrefixAndSuffix) {
    EXPECT_EQ(unicodeSpacePrefix("\tx"), 1u);
    EXPECT_EQ(unicodeSpacePrefix("\xC2\xA0x"), 2u);
    EXPECT_EQ(unicodeSpacePrefix("\xE3\x80\x80x"), 3u);
    EXPECT_EQ(unicodeSpacePrefix("\xEF\xBB\xBFx"), 3u);
    EXPECT_EQ(unicodeSpacePrefix("\xE2\x80\x8Bx"), 0u);  // zero width space is not whitespace
    EXPECT_EQ(unicodeSpacePrefix("\xC3\xA9"), 0u);
    EXPECT_EQ(unicodeSpacePrefix(""), 0u);
    EXPECT_EQ(unicodeSpaceSuffix("x\xE2\x80\xA9"), 3u);
    EXPECT_EQ(unicodeSpaceSuffix("x\xA0"), 0u);
}

TEST(StringUtilsTest, TrimUnicode) {
    EXPECT_EQ(trimUnicode("\xC2\xA0 hello\xE3\x80\x80\r"), "hello");
    EXPECT_EQ(ltrimUnicode("\xE1\x9A\x80{\"a\":1}"), "{\"a\":1}");
    EXPECT_TRUE(trimUnicode("\xE2\x80\x80\xE2\x80\xAF\xE2\x81\x9F").empty());
    EXPECT_EQ(trim("\xC2\xA0hi"), "\xC2\xA0hi");
}

TEST(StringUtilsTest, CaseHelpers) {
    EXPECT_EQ(toUpper("Warning"), "WARNING");
    EXPECT_EQ(toLower("ERROR"), "error");
    EXPECT_TRUE(iequals("Replace", "REPLACE"));
    EXPECT_FALSE(iequals("warn", "warning"));
    EXPECT_TRUE(startsWith("Caused by: x", "Caused by"));
    EXPECT_FALSE(startsWith("Cause", "Caused by"));
}

TEST(StringUtilsTest, ContainsIgnoreCase) {
    EXPECT_TRUE(containsIgnoreCase("Connection REFUSED by peer", "refused"));
    EXPECT_TRUE(containsIgnoreCase("anything", ""));
    EXPECT_FALSE(containsIgnoreCase("short", "much longer needle"));
    EXPECT_FALSE(containsIgnoreCase("timeout", "refused"));
}

TEST(StringUtilsTest, SplitKeepsEmptyFields) {
    const auto parts = split("a\n\nb", '\n');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_TRUE(parts[1].empty());
    EXPECT_EQ(parts[2], "b");

    EXPECT_EQ(split("", ',').size(), 1u);
}

TEST(StringUtilsTest, ParseByteSize) {
    EXPECT_EQ(parseByteSize("4096"), 4096u);
    EXPECT_EQ(parseByteSize("256KiB"), 256u * 1024u);
    EXPECT_EQ(parseByteSize("1 MB"), 1024u * 1024u);
    EXPECT_EQ(parseByteSize(" 30m "), 30u * 1024u * 1024u);
    EXPECT_EQ(parseByteSize("2G"), 2ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(parseByteSize("0"), 0u);
}

TEST(StringUtilsTest, ParseByteSizeRejectsGarbage) {
    EXPECT_FALSE(parseByteSize(""));
    EXPECT_FALSE(parseByteSize("MB"));
    EXPECT_FALSE(parseByteSize("-1"));
    EXPECT_FALSE(parseByteSize("12 bananas"));
    EXPECT_FALSE(parseByteSize("99999999999999999999"));
    EXPECT_FALSE(parseByteSize("18446744073709551615G"));
}

TEST(StringUtilsTest, EscapeJson) {
    EXPECT_EQ(escapeJson("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(escapeJson("line1\nline2\t"), "line1\\nline2\\t");
    EXPECT_EQ(escapeJson(std::string("\x01", 1)), "\\u0001");
    EXPECT_EQ(escapeJson("caf\xC3\xA9"), "caf\xC3\xA9");
}

}  // namespace LogSeg::test
