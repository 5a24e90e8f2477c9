#include "test_utils.hpp"
#include "multibar/core/bar_renderer.hpp"
#include "multibar/common/constants.hpp"
#include "multibar/format/format_utils.hpp"
#include <limits>

using multibar::core::BarRenderer;
using multibar::core::Style;
using multibar::format::displayWidth;
using multibar::testing::makeRecord;

namespace {

std::string repeat(const std::string& glyph, size_t count) {
    std::string result;
    for (size_t i = 0; i < count; ++i) result += glyph;
    return result;
}

}

TEST(BarRenderer, half_done_at_width_40){
    auto record = makeRecord(100, 50);
    auto line = BarRenderer::renderLine(record, record.created_at, 40);

    EXPECT_EQ(" 50%|" + repeat("█", 5) + repeat(" ", 5) + "| 50/100 [00:00<?, ?it/s]", line);
    EXPECT_EQ(40u, displayWidth(line));
}

TEST(BarRenderer, label_rate_and_eta){
    auto record = makeRecord(10, 5);
    record.config.label = "dl";
    record.rate_estimate = 2.5;

    auto line = BarRenderer::renderLine(record, record.created_at + std::chrono::seconds(4), 60);

    EXPECT_EQ("dl:  50%|" + repeat("█", 10) + "▌" + repeat(" ", 10) + "| 5/10 [00:04<00:02, 2.50it/s]", line);
    EXPECT_EQ(60u, displayWidth(line));
}

TEST(BarRenderer, exact_width_across_progress){
    for (uint64_t completed : {0, 1, 33, 50, 99, 100}) {
        auto record = makeRecord(100, completed);
        record.rate_estimate = 7.0;
        for (size_t width : {45, 80, 133}) {
            auto line = BarRenderer::renderLine(record, record.created_at, width);
            EXPECT_EQ(width, displayWidth(line)) << line;
        }
    }
}

TEST(BarRenderer, percent_stays_in_range){
    auto over = makeRecord(10, 25);
    auto line = BarRenderer::renderLine(over, over.created_at, 50);
    EXPECT_EQ(0u, line.find("100%|")) << line;
    EXPECT_NE(std::string::npos, line.find("| 25/10 [")) << line;

    auto start = makeRecord(1000, 0);
    line = BarRenderer::renderLine(start, start.created_at, 50);
    EXPECT_EQ(0u, line.find("  0%|")) << line;

    auto almost = makeRecord(1000, 999);
    line = BarRenderer::renderLine(almost, almost.created_at, 50);
    EXPECT_EQ(0u, line.find(" 99%|")) << line;
}

TEST(BarRenderer, zero_total_renders_complete){
    auto record = makeRecord(0, 0);
    auto line = BarRenderer::renderLine(record, record.created_at, 40);

    EXPECT_EQ(0u, line.find("100%|")) << line;
    EXPECT_NE(std::string::npos, line.find(repeat("█", 10))) << line;
    EXPECT_NE(std::string::npos, line.find("| 0/0 [00:00<?, ?it/s]")) << line;
}

TEST(BarRenderer, unbounded_line){
    auto record = makeRecord(std::nullopt, 20);
    record.rate_estimate = 10.0;
    EXPECT_EQ("20it [00:01, 10.00it/s]",
              BarRenderer::renderLine(record, record.created_at + std::chrono::seconds(1), 80));

    record.config.label = "rows";
    record.rate_estimate.reset();
    EXPECT_EQ("rows: 20it [00:00, ?it/s]", BarRenderer::renderLine(record, record.created_at, 80));
}

TEST(BarRenderer, narrow_width_drops_the_fill){
    auto record = makeRecord(100, 50);
    auto line = BarRenderer::renderLine(record, record.created_at, 10);
    EXPECT_EQ(" 50%|| 50/100 [00:00<?, ?it/s]", line);
}

TEST(BarRenderer, elapsed_never_negative){
    auto record = makeRecord(std::nullopt, 1);
    auto line = BarRenderer::renderLine(record, record.created_at - std::chrono::seconds(5), 80);
    EXPECT_EQ("1it [00:00, ?it/s]", line);
}

TEST(BarRenderer, glyph_bar_partial_cells){
    EXPECT_EQ("##5       ", BarRenderer::renderGlyphBar(Style::ascii(), 25, 100, 10));
    EXPECT_EQ("0         ", BarRenderer::renderGlyphBar(Style::ascii(), 0, 100, 10));
    EXPECT_EQ("#########9", BarRenderer::renderGlyphBar(Style::ascii(), 999, 1000, 10));
    EXPECT_EQ("##########", BarRenderer::renderGlyphBar(Style::ascii(), 100, 100, 10));
    EXPECT_EQ("##########", BarRenderer::renderGlyphBar(Style::ascii(), 12, 10, 10));
    EXPECT_EQ("", BarRenderer::renderGlyphBar(Style::ascii(), 1, 2, 0));
}

TEST(BarRenderer, glyph_bar_balloon_pops_at_the_edge){
    EXPECT_EQ("**O  ", BarRenderer::renderGlyphBar(Style::balloon(), 5, 10, 5));
    EXPECT_EQ(".    ", BarRenderer::renderGlyphBar(Style::balloon(), 0, 10, 5));
    EXPECT_EQ("*****", BarRenderer::renderGlyphBar(Style::balloon(), 10, 10, 5));
}

TEST(BarRenderer, glyph_bar_custom_style){
    auto style = Style::custom({"-", "="});
    EXPECT_EQ("==---", BarRenderer::renderGlyphBar(style, 1, 2, 5));
}

TEST(BarRenderer, glyph_bar_whole_cells_are_exact){
    for (uint64_t completed = 0; completed < 100; ++completed) {
        std::string expected = repeat("█", completed / 2) + (completed % 2 ? "▌" : " ")
                               + repeat(" ", 50 - completed / 2 - 1);
        EXPECT_EQ(expected, BarRenderer::renderGlyphBar(Style::block(), completed, 100, 50))
            << completed << "/100";
    }
    EXPECT_EQ(repeat("█", 29) + repeat(" ", 71), BarRenderer::renderGlyphBar(Style::block(), 29, 100, 100));
    EXPECT_EQ(repeat("█", 57) + repeat(" ", 43), BarRenderer::renderGlyphBar(Style::block(), 57, 100, 100));
}

TEST(BarRenderer, every_percent_is_floored_exactly){
    for (uint64_t completed = 0; completed <= 100; ++completed) {
        auto record = makeRecord(100, completed);
        auto line = BarRenderer::renderLine(record, record.created_at, 80);

        std::string digits = std::to_string(completed);
        std::string head = std::string(3 - digits.size(), ' ') + digits + "%|";
        EXPECT_EQ(0u, line.find(head)) << line;
    }

    auto third = makeRecord(3, 1);
    EXPECT_EQ(0u, BarRenderer::renderLine(third, third.created_at, 80).find(" 33%|"));

    auto huge = makeRecord(std::numeric_limits<uint64_t>::max(), std::numeric_limits<uint64_t>::max() - 1);
    EXPECT_EQ(0u, BarRenderer::renderLine(huge, huge.created_at, 80).find(" 99%|"));
}

TEST(BarRenderer, oversized_width_is_capped){
    auto record = makeRecord(100, 50);
    std::string line;
    EXPECT_NO_THROW(line = BarRenderer::renderLine(record, record.created_at, std::numeric_limits<size_t>::max()));
    EXPECT_EQ(multibar::constants::limits::MAX_RENDER_WIDTH, displayWidth(line));

    EXPECT_NO_THROW(line = BarRenderer::renderGlyphBar(Style::block(), 1, 2, std::numeric_limits<size_t>::max()));
    EXPECT_EQ(multibar::constants::limits::MAX_RENDER_WIDTH, displayWidth(line));
}

TEST(BarRenderer, wide_label_keeps_exact_width){
    auto record = makeRecord(100, 50);
    record.config.label = "进度";
    auto line = BarRenderer::renderLine(record, record.created_at, 40);

    EXPECT_EQ(0u, line.find("进度:  50%|"));
    EXPECT_EQ(40u, displayWidth(line));
}

TEST(BarRenderer, resolve_width){
    auto record = makeRecord(10);
    EXPECT_EQ(120u, BarRenderer::resolveWidth(record, 120));
    EXPECT_EQ(80u, BarRenderer::resolveWidth(record, 0));

    record.config.fixed_width = 40;
    EXPECT_EQ(40u, BarRenderer::resolveWidth(record, 120));
}
