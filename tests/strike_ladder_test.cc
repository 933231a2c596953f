// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/analytics/strike_ladder.hpp"
#include <algorithm>
#include <vector>

namespace kumquat {
namespace {

TEST(StrikeLadderTest, StepBySpotBand) {
    EXPECT_DOUBLE_EQ(strike_step(250.0), 5.0);
    EXPECT_DOUBLE_EQ(strike_step(100.5), 5.0);
    EXPECT_DOUBLE_EQ(strike_step(100.0), 2.5);
    EXPECT_DOUBLE_EQ(strike_step(75.0), 2.5);
    EXPECT_DOUBLE_EQ(strike_step(50.0), 1.0);
    EXPECT_DOUBLE_EQ(strike_step(3.0), 1.0);
}

TEST(StrikeLadderTest, AtmRoundsToStep) {
    EXPECT_DOUBLE_EQ(atm_strike(152.4), 150.0);
    EXPECT_DOUBLE_EQ(atm_strike(153.0), 155.0);
    EXPECT_DOUBLE_EQ(atm_strike(76.0), 75.0);
    EXPECT_DOUBLE_EQ(atm_strike(23.4), 23.0);
}

TEST(StrikeLadderTest, LadderSpansTenStepsEachSide) {
    auto strikes = strike_ladder(152.4);
    ASSERT_EQ(strikes.size(), 21u);
    EXPECT_DOUBLE_EQ(strikes.front(), 100.0);
    EXPECT_DOUBLE_EQ(strikes[10], 150.0);
    EXPECT_DOUBLE_EQ(strikes.back(), 200.0);
    EXPECT_TRUE(std::is_sorted(strikes.begin(), strikes.end()));
}

TEST(StrikeLadderTest, LadderDropsNonPositiveStrikes) {
    auto strikes = strike_ladder(4.2);
    // ATM 4, step 1: 1..14
    ASSERT_EQ(strikes.size(), 14u);
    EXPECT_DOUBLE_EQ(strikes.front(), 1.0);
    EXPECT_DOUBLE_EQ(strikes.back(), 14.0);
}

TEST(StrikeLadderTest, CustomWidth) {
    auto strikes = strike_ladder(60.0, 2);
    ASSERT_EQ(strikes.size(), 5u);
    EXPECT_DOUBLE_EQ(strikes.front(), 55.0);
    EXPECT_DOUBLE_EQ(strikes.back(), 65.0);
}

TEST(StrikeLadderTest, CenteredStrikesOddCount) {
    auto strikes = centered_strikes(100.0, 11);
    ASSERT_EQ(strikes.size(), 11u);
    EXPECT_DOUBLE_EQ(strikes[5], 100.0);
    EXPECT_DOUBLE_EQ(strikes.front(), 87.5);
    EXPECT_DOUBLE_EQ(strikes.back(), 112.5);
}

TEST(StrikeLadderTest, CenteredStrikesEvenCountExtraBelow) {
    auto strikes = centered_strikes(100.0, 4);
    EXPECT_EQ(strikes, (std::vector<double>{95.0, 97.5, 100.0, 102.5}));
}

TEST(StrikeLadderTest, CenteredStrikesShiftUpNearZero) {
    auto strikes = centered_strikes(3.0, 11);
    ASSERT_EQ(strikes.size(), 11u);
    EXPECT_DOUBLE_EQ(strikes.front(), 1.0);
    EXPECT_DOUBLE_EQ(strikes.back(), 11.0);
    for (double k : strikes) {
        EXPECT_GT(k, 0.0);
    }
}

TEST(StrikeLadderTest, CenteredStrikesZeroCount) {
    EXPECT_TRUE(centered_strikes(100.0, 0).empty());
}

}  // namespace
}  // namespace kumquat
