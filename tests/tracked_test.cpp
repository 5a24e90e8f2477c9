#include "test_utils.hpp"
#include "multibar/core/tracked.hpp"
#include "multibar/multibar.hpp"
#include <list>
#include <sstream>

using multibar::core::track;
using multibar::testing::makeDisplay;
using ::testing::HasSubstr;
using ::testing::StartsWith;

TEST(Tracked, counts_every_element_and_closes_at_end){
    auto fx = makeDisplay();
    std::vector<int> items = {1, 2, 3, 4};

    int sum = 0;
    for (int value : track(items, fx.display)) {
        sum += value;
    }

    EXPECT_EQ(10, sum);
    EXPECT_EQ(0u, fx.display->registry().size());
    EXPECT_THAT(fx.terminal->screen()[0], StartsWith("100%|"));
    EXPECT_THAT(fx.terminal->screen()[0], HasSubstr("| 4/4 ["));
}

TEST(Tracked, total_taken_from_forward_range){
    auto fx = makeDisplay();
    std::list<std::string> names = {"a", "b", "c"};

    auto tracked = track(names, fx.display);
    auto record = fx.display->registry().get(tracked.handle().id());
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(record->total.has_value());
    EXPECT_EQ(3u, *record->total);
}

TEST(Tracked, early_exit_closes_with_partial_count){
    auto fx = makeDisplay();
    std::vector<int> items = {1, 2, 3, 4};

    for (int value : track(items, fx.display)) {
        if (value == 3) {
            break;
        }
    }

    EXPECT_EQ(0u, fx.display->registry().size());
    EXPECT_THAT(fx.terminal->screen()[0], HasSubstr("| 2/4 ["));
}

TEST(Tracked, empty_range_closes_immediately){
    auto fx = makeDisplay();
    std::vector<int> items;

    size_t visited = 0;
    for (int value : track(items, fx.display)) {
        visited += static_cast<size_t>(value);
    }

    EXPECT_EQ(0u, visited);
    EXPECT_EQ(0u, fx.display->registry().size());
    EXPECT_THAT(fx.terminal->screen()[0], HasSubstr("| 0/0 ["));
}

TEST(Tracked, input_iterators_give_unbounded_bar){
    auto fx = makeDisplay();
    std::istringstream input("5 6 7");

    int sum = 0;
    for (int value : track(std::istream_iterator<int>(input), std::istream_iterator<int>(), fx.display)) {
        sum += value;
    }

    EXPECT_EQ(18, sum);
    EXPECT_EQ("3it [00:00, ?it/s]", fx.terminal->screen()[0]);
}

TEST(Tracked, elements_are_mutable_through_the_wrapper){
    auto fx = makeDisplay();
    std::vector<int> items = {1, 2, 3};

    for (int& value : track(items, fx.display)) {
        value *= 10;
    }

    EXPECT_EQ((std::vector<int>{10, 20, 30}), items);
}

TEST(Tracked, global_display_shortcuts){
    std::vector<int> items = {1, 2, 3};

    int sum = 0;
    for (int value : multibar::tqdm(items)) {
        sum += value;
    }
    EXPECT_EQ(6, sum);

    auto bar = multibar::create(2);
    EXPECT_TRUE(bar.valid());
    bar.advance(2);
    multibar::refresh();
    bar.close();
    EXPECT_EQ(0u, multibar::Display::global()->registry().size());
}
