#include <gtest/gtest.h>
#include <random>
#include "playback/TrimRange.h"

using playback::TrimRange;

TEST(TrimRange, OutBeforeInClearsIn)
{
    TrimRange trim;
    trim.setIn(5.0);
    trim.setOut(3.0);
    EXPECT_FALSE(trim.in().has_value());
    EXPECT_EQ(trim.out(), 3.0);
    EXPECT_FALSE(trim.isExportable());
}

TEST(TrimRange, InAfterOutClearsOut)
{
    TrimRange trim;
    trim.setOut(3.0);
    trim.setIn(3.0);
    EXPECT_EQ(trim.in(), 3.0);
    EXPECT_FALSE(trim.out().has_value());
}

TEST(TrimRange, ValidRangeIsExportable)
{
    TrimRange trim;
    trim.setIn(1.5);
    trim.setOut(4.0);
    EXPECT_TRUE(trim.isExportable());
    EXPECT_DOUBLE_EQ(*trim.length(), 2.5);

    trim.clearOut();
    EXPECT_FALSE(trim.isExportable());
    EXPECT_FALSE(trim.length().has_value());
    trim.setOut(2.0);
    trim.clearAll();
    EXPECT_EQ(trim, TrimRange{});
}

TEST(TrimRange, InvariantHoldsForAnyCallSequence)
{
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> time(0.0, 10.0);
    std::uniform_int_distribution<int> op(0, 3);
    TrimRange trim;
    for (int i = 0; i < 2000; ++i) {
        auto before = trim;
        double t = time(rng);
        switch (op(rng)) {
        case 0:
            trim.setIn(t);
            EXPECT_EQ(trim.in(), t);
            // 只清除会破坏约束的那个点
            if (before.out() && *before.out() > t) {
                EXPECT_EQ(trim.out(), before.out());
            }
            break;
        case 1:
            trim.setOut(t);
            EXPECT_EQ(trim.out(), t);
            if (before.in() && *before.in() < t) {
                EXPECT_EQ(trim.in(), before.in());
            }
            break;
        case 2:
            trim.clearIn();
            break;
        default:
            trim.clearOut();
            break;
        }
        if (trim.in() && trim.out()) {
            ASSERT_LT(*trim.in(), *trim.out());
        }
    }
}
