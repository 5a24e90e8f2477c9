#include "test_utils.hpp"
#include "multibar/format/format_utils.hpp"
#include <limits>

using namespace multibar::format;

TEST(FormatUtils, sanitize_replaces_control_characters){
    EXPECT_EQ("a<1B>[2Jb", sanitizeControlCharacters("a\033[2Jb"));
    EXPECT_EQ("line<0A>next", sanitizeControlCharacters("line\nnext"));
    EXPECT_EQ("<7F>", sanitizeControlCharacters("\x7f"));
    EXPECT_EQ("plain ✓", sanitizeControlCharacters("plain ✓"));
}

TEST(FormatUtils, split_code_points){
    auto points = splitCodePoints("a█é");
    ASSERT_EQ(3u, points.size());
    EXPECT_EQ("a", points[0]);
    EXPECT_EQ("█", points[1]);
    EXPECT_EQ("é", points[2]);
}

TEST(FormatUtils, split_replaces_malformed_bytes){
    auto points = splitCodePoints(std::string("x\xE2\x96", 3));
    ASSERT_EQ(3u, points.size());
    EXPECT_EQ("x", points[0]);
    EXPECT_EQ("�", points[1]);
    EXPECT_EQ("�", points[2]);
}

TEST(FormatUtils, display_width_counts_code_points){
    EXPECT_EQ(0u, displayWidth(""));
    EXPECT_EQ(5u, displayWidth("hello"));
    EXPECT_EQ(3u, displayWidth("▏▎▍"));
}

TEST(FormatUtils, wide_code_points_take_two_columns){
    EXPECT_EQ(2u, codePointWidth("中"));
    EXPECT_EQ(2u, codePointWidth("가"));
    EXPECT_EQ(2u, codePointWidth("🚀"));
    EXPECT_EQ(1u, codePointWidth("█"));
    EXPECT_EQ(1u, codePointWidth("é"));
    EXPECT_EQ(1u, codePointWidth("a"));

    EXPECT_EQ(6u, displayWidth("ab中文"));
    EXPECT_EQ(4u, displayWidth("进度"));
}

TEST(FormatUtils, fit_to_width_never_splits_a_wide_glyph){
    EXPECT_EQ("中 ", fitToWidth("中文", 3));
    EXPECT_EQ("中文", fitToWidth("中文", 4));
    EXPECT_EQ("a中 ", fitToWidth("a中文", 4));
    EXPECT_EQ(5u, displayWidth(fitToWidth("中文字", 5)));
}

TEST(FormatUtils, fit_to_width){
    EXPECT_EQ("abc  ", fitToWidth("abc", 5));
    EXPECT_EQ("abc", fitToWidth("abc", 3));
    EXPECT_EQ("ab", fitToWidth("abcdef", 2));
    EXPECT_EQ("██", fitToWidth("███", 2));
    EXPECT_EQ("", fitToWidth("abc", 0));
}

TEST(FormatUtils, format_time){
    EXPECT_EQ("00:00", formatTime(0));
    EXPECT_EQ("01:05", formatTime(65));
    EXPECT_EQ("59:59", formatTime(3599));
    EXPECT_EQ("01:00:00", formatTime(3600));
    EXPECT_EQ("27:46:40", formatTime(100000));
}

TEST(FormatUtils, format_eta){
    EXPECT_EQ("?", formatEta(std::nullopt));
    EXPECT_EQ("?", formatEta(std::numeric_limits<double>::infinity()));
    EXPECT_EQ("?", formatEta(-1.0));
    EXPECT_EQ("00:05", formatEta(5.9));
}

TEST(FormatUtils, format_rate){
    EXPECT_EQ("?", formatRate(std::nullopt));
    EXPECT_EQ("?", formatRate(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_EQ("10.00", formatRate(10.0));
    EXPECT_EQ("0.33", formatRate(1.0 / 3.0));
}
