/// @file tests/rate/test_poisson.cpp
/// @brief Unit tests for the log-space Poisson pmf / cdf.
///
/// Test categories:
///   - Closed-form values for small k
///   - λ = 0 degenerate distribution
///   - Invalid λ (negative, NaN, ∞) → nullopt
///   - Large λ stays finite (no factorial overflow)
///   - cdf monotone and bounded by 1

#include <gtest/gtest.h>
#include "inplay/poisson.hpp"

#include <cmath>
#include <limits>

using namespace inplay;

static constexpr double EPS = 1e-12;

TEST(Poisson, PmfClosedForm) {
    const double l = 1.2;
    EXPECT_NEAR(*poisson::pmf(0, l), std::exp(-l), EPS);
    EXPECT_NEAR(*poisson::pmf(1, l), l * std::exp(-l), EPS);
    EXPECT_NEAR(*poisson::pmf(2, l), l * l / 2.0 * std::exp(-l), EPS);
}

TEST(Poisson, CdfClosedForm) {
    // e^{-1.2}(1 + 1.2)
    EXPECT_NEAR(*poisson::cdf(1, 1.2), std::exp(-1.2) * 2.2, EPS);
}

TEST(Poisson, AtLeastIsComplementOfCdf) {
    EXPECT_NEAR(*poisson::at_least(2, 1.2), 1.0 - std::exp(-1.2) * 2.2, EPS);
    EXPECT_DOUBLE_EQ(*poisson::at_least(0, 1.2), 1.0);
}

TEST(Poisson, ZeroLambdaIsPointMass) {
    EXPECT_DOUBLE_EQ(*poisson::pmf(0, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(*poisson::pmf(3, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(*poisson::cdf(0, 0.0), 1.0);
}

TEST(Poisson, NegativeKHasNoMass) {
    EXPECT_DOUBLE_EQ(*poisson::pmf(-1, 2.0), 0.0);
    EXPECT_DOUBLE_EQ(*poisson::cdf(-1, 2.0), 0.0);
}

TEST(Poisson, InvalidLambdaRejected) {
    EXPECT_FALSE(poisson::pmf(1, -0.1).has_value());
    EXPECT_FALSE(poisson::pmf(1, std::numeric_limits<double>::quiet_NaN()).has_value());
    EXPECT_FALSE(poisson::cdf(1, std::numeric_limits<double>::infinity()).has_value());
    EXPECT_FALSE(poisson::at_least(1, -3.0).has_value());
}

TEST(Poisson, LargeLambdaStaysFinite) {
    auto p = poisson::pmf(200, 200.0);
    ASSERT_TRUE(p.has_value());
    EXPECT_TRUE(std::isfinite(*p));
    EXPECT_GT(*p, 0.0);
    EXPECT_LT(*p, 0.1);

    auto c = poisson::cdf(400, 200.0);
    ASSERT_TRUE(c.has_value());
    EXPECT_LE(*c, 1.0);
    EXPECT_NEAR(*c, 1.0, 1e-9);
}

TEST(Poisson, CdfMonotoneInK) {
    double prev = 0.0;
    for (int k = 0; k < 15; ++k) {
        const double c = *poisson::cdf(k, 3.4);
        EXPECT_GE(c, prev);
        EXPECT_LE(c, 1.0);
        prev = c;
    }
}
