#include <gtest/gtest.h>
#include "nestbar/format/format_utils.hpp"
#include <limits>

using namespace nestbar::format;

TEST(FormatUtilsTest, SanitizeReplacesControlBytes) {
    EXPECT_EQ(sanitizeControlCharacters("a\nb"), "a<0A>b");
    EXPECT_EQ(sanitizeControlCharacters("\r"), "<0D>");
    EXPECT_EQ(sanitizeControlCharacters("x\x7F"), "x<7F>");
    EXPECT_EQ(sanitizeControlCharacters("\x1b[31m"), "<1B>[31m");
}

TEST(FormatUtilsTest, SanitizeKeepsValidUtf8AndReplacesInvalid) {
    EXPECT_EQ(sanitizeControlCharacters("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(sanitizeControlCharacters("\xFF"), "\uFFFD");
    EXPECT_EQ(sanitizeControlCharacters("a\xC3"), "a\uFFFD");
}

TEST(FormatUtilsTest, DisplayWidthCountsCodepoints) {
    EXPECT_EQ(displayWidth(""), 0u);
    EXPECT_EQ(displayWidth("abc"), 3u);
    EXPECT_EQ(displayWidth("\xE2\x96\x88\xE2\x96\x88"), 2u);
}

TEST(FormatUtilsTest, TruncateAndPadWorkOnGlyphs) {
    EXPECT_EQ(truncateToWidth("h\xC3\xA9llo", 2), "h\xC3\xA9");
    EXPECT_EQ(truncateToWidth("abc", 5), "abc");
    EXPECT_EQ(padToWidth("ab", 4), "ab  ");
    EXPECT_EQ(padToWidth("abcdef", 4), "abcd");
    EXPECT_EQ(repeatGlyph("\xE2\x96\x88", 3), "\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88");
}

TEST(FormatUtilsTest, FormatTime) {
    EXPECT_EQ(formatTime(0), "00:00");
    EXPECT_EQ(formatTime(65), "01:05");
    EXPECT_EQ(formatTime(3661), "1:01:01");
    EXPECT_EQ(formatTime(-3), "00:00");
    EXPECT_EQ(formatTime(std::numeric_limits<double>::quiet_NaN()), "00:00");
    EXPECT_EQ(formatTime(std::numeric_limits<double>::infinity()), "00:00");
}

TEST(FormatUtilsTest, FormatRateSwitchesUnitsBelowOne) {
    EXPECT_EQ(formatRate(12.5), "12.50it/s");
    EXPECT_EQ(formatRate(1.0), "1.00it/s");
    EXPECT_EQ(formatRate(0.5), "2.00s/it");
}

TEST(FormatUtilsTest, RightJustify) {
    EXPECT_EQ(rightJustify("ab", 4), "  ab");
    EXPECT_EQ(rightJustify("abcde", 4), "abcde");
}
