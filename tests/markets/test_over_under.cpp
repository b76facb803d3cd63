/// @file tests/markets/test_over_under.cpp
/// @brief Unit tests for the Poisson Over/Under pricer and the Next Goal split.

#include <gtest/gtest.h>
#include "inplay/markets.hpp"

#include <cmath>
#include <limits>

using namespace inplay;
using namespace inplay::markets;

// ─── price_over_under ────────────────────────────────────────────────────────

TEST(PriceOverUnder, OverTwoPointFiveWithOneScored) {
    // needed = 2; P(Over) = 1 − e^{−1.2}(1 + 1.2)
    auto ou = price_over_under(1.0, 2.5, 1.2);
    ASSERT_TRUE(ou.has_value());
    EXPECT_EQ(ou->needed, 2);
    EXPECT_FALSE(ou->resolved);
    EXPECT_NEAR(ou->over, 33.7, 0.5);
    EXPECT_NEAR(ou->over, 100.0 * (1.0 - std::exp(-1.2) * 2.2), 1e-9);
    EXPECT_NEAR(ou->over + ou->under, 100.0, 1e-9);
}

TEST(PriceOverUnder, PassedLineIsResolved) {
    auto ou = price_over_under(3.0, 2.5, 0.4);
    ASSERT_TRUE(ou.has_value());
    EXPECT_TRUE(ou->resolved);
    EXPECT_DOUBLE_EQ(ou->over, 100.0);
    EXPECT_DOUBLE_EQ(ou->under, 0.0);
}

TEST(PriceOverUnder, NothingExpectedMeansUnder) {
    auto ou = price_over_under(2.0, 2.5, 0.0);
    ASSERT_TRUE(ou.has_value());
    EXPECT_DOUBLE_EQ(ou->over, 0.0);
    EXPECT_DOUBLE_EQ(ou->under, 100.0);
}

TEST(PriceOverUnder, WholeLineNeedsOneMore) {
    auto ou = price_over_under(2.0, 2.0, 1.0);
    ASSERT_TRUE(ou.has_value());
    EXPECT_FALSE(ou->resolved);
    EXPECT_EQ(ou->needed, 1);
}

TEST(PriceOverUnder, InvalidInputRejected) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(price_over_under(nan, 2.5, 1.0).has_value());
    EXPECT_FALSE(price_over_under(0.0, nan, 1.0).has_value());
    EXPECT_FALSE(price_over_under(0.0, 2.5, -1.0).has_value());
    EXPECT_FALSE(price_over_under(0.0, 1e12, 1.0).has_value());
}

// ─── split_next_goal ─────────────────────────────────────────────────────────

TEST(SplitNextGoal, ReferenceScenario) {
    // 0.06/min and 0.04/min over 30 minutes.
    auto s = split_next_goal(0.06 * 30.0, 0.04 * 30.0);
    ASSERT_TRUE(s.has_value());
    const double p_goal = 1.0 - std::exp(-3.0);
    EXPECT_NEAR(s->home, 100.0 * p_goal * 0.6, 1e-9);
    EXPECT_NEAR(s->away, 100.0 * p_goal * 0.4, 1e-9);
    EXPECT_NEAR(s->home, 57.0, 0.1);
    EXPECT_NEAR(s->away, 38.0, 0.1);
    EXPECT_NEAR(s->none, 5.0, 0.1);
    EXPECT_NEAR(s->home + s->away + s->none, 100.0, 1e-9);
}

TEST(SplitNextGoal, NoRateMeansNoGoal) {
    auto s = split_next_goal(0.0, 0.0);
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(s->home, 0.0);
    EXPECT_DOUBLE_EQ(s->away, 0.0);
    EXPECT_DOUBLE_EQ(s->none, 100.0);
}

TEST(SplitNextGoal, SumsToHundredAcrossRates) {
    for (double h : {0.01, 0.3, 1.0, 2.5, 8.0}) {
        for (double a : {0.0, 0.2, 1.7, 6.0}) {
            auto s = split_next_goal(h, a);
            ASSERT_TRUE(s.has_value());
            EXPECT_NEAR(s->home + s->away + s->none, 100.0, 1e-9);
            EXPECT_GE(s->none, 0.0);
        }
    }
}

TEST(SplitNextGoal, InvalidInputRejected) {
    EXPECT_FALSE(split_next_goal(-0.1, 1.0).has_value());
    EXPECT_FALSE(split_next_goal(std::numeric_limits<double>::infinity(), 1.0).has_value());
}
