#include <gtest/gtest.h>
#include "tree/selection.hpp"

#include <algorithm>
#include <stdexcept>

using namespace kchoice;

TEST(SelectionTest, SetAndTest) {
    Selection s(3);
    EXPECT_TRUE(s.empty());
    s.set(1);
    EXPECT_TRUE(s.test(1));
    EXPECT_FALSE(s.test(0));
    EXPECT_EQ(s.count(), 1u);
    EXPECT_EQ(s.toString(), "[0,1,0]");
    EXPECT_EQ(s.toBits(), (std::vector<int>{0, 1, 0}));

    EXPECT_THROW(s.test(3), std::out_of_range);
    EXPECT_THROW(s.set(7), std::out_of_range);
}

TEST(SelectionTest, WithLeavesOriginalUntouched) {
    Selection base(2);
    Selection next = base.with(0);
    EXPECT_TRUE(base.empty());
    EXPECT_EQ(next.toString(), "[1,0]");
}

TEST(SelectionTest, Union) {
    Selection a = Selection(4).with(0).with(2);
    Selection b = Selection(4).with(2).with(3);
    EXPECT_EQ((a | b).toString(), "[1,0,1,1]");
    EXPECT_THROW(a | Selection(5), std::invalid_argument);
}

TEST(SelectionTest, OrderingIsLexicographic) {
    std::vector<Selection> all = {
        Selection(2).with(0).with(1),
        Selection(2).with(0),
        Selection(2),
        Selection(2).with(1),
    };
    std::sort(all.begin(), all.end());

    EXPECT_EQ(all[0].toString(), "[0,0]");
    EXPECT_EQ(all[1].toString(), "[0,1]");
    EXPECT_EQ(all[2].toString(), "[1,0]");
    EXPECT_EQ(all[3].toString(), "[1,1]");

    EXPECT_FALSE(all[1] < all[1]);
}

TEST(SelectionTest, SpansMultipleWords) {
    Selection s(130);
    s.set(0);
    s.set(64);
    s.set(129);
    EXPECT_EQ(s.count(), 3u);
    EXPECT_TRUE(s.test(129));
    EXPECT_FALSE(s.test(65));

    // Item 64 is more significant than item 129.
    Selection t = Selection(130).with(0).with(65);
    EXPECT_TRUE(t < s);
}
